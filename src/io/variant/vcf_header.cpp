// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "vcf_header.hpp"

#include <algorithm>

#include "vcf_spec.hpp"

namespace varcanon {

unsigned VcfHeader::num_samples() const noexcept
{
    return static_cast<unsigned>(samples_.size());
}

const std::vector<std::string>& VcfHeader::samples() const noexcept
{
    return samples_;
}

boost::optional<VcfHeader::ValueType> VcfHeader::get(const KeyType& key) const
{
    for (const auto& field : basic_fields_) {
        if (field.first == key) return field.second;
    }
    return boost::none;
}

std::vector<VcfHeader::ValueType> VcfHeader::get_all(const KeyType& key) const
{
    std::vector<ValueType> result {};
    for (const auto& field : basic_fields_) {
        if (field.first == key) result.push_back(field.second);
    }
    return result;
}

const VcfHeader::StructuredField* VcfHeader::find_structured(const KeyType& tag, const ValueType& id) const noexcept
{
    for (const auto& field : structured_fields_) {
        if (field.first != tag) continue;
        const auto itr = field.second.find(vcfspec::header::id);
        if (itr != std::cend(field.second) && itr->second == id) return &field.second;
    }
    return nullptr;
}

bool VcfHeader::has_structured_field(const KeyType& tag, const ValueType& id) const noexcept
{
    return find_structured(tag, id) != nullptr;
}

std::vector<VcfHeader::StructuredField> VcfHeader::structured_fields(const KeyType& tag) const
{
    std::vector<StructuredField> result {};
    for (const auto& field : structured_fields_) {
        if (field.first == tag) result.push_back(field.second);
    }
    return result;
}

boost::optional<VcfHeader::ValueType>
VcfHeader::find(const KeyType& tag, const ValueType& id, const KeyType& search_key) const
{
    const auto field = find_structured(tag, id);
    if (!field) return boost::none;
    const auto itr = field->find(search_key);
    if (itr == std::cend(*field)) return boost::none;
    return itr->second;
}

bool has_info(const VcfHeader& header, const VcfHeader::ValueType& id)
{
    return header.has_structured_field(vcfspec::header::info, id);
}

bool has_format(const VcfHeader& header, const VcfHeader::ValueType& id)
{
    return header.has_structured_field(vcfspec::header::format, id);
}

// VcfHeader::Builder

VcfHeader::Builder& VcfHeader::Builder::set_samples(std::vector<std::string> samples)
{
    header_.samples_ = std::move(samples);
    return *this;
}

VcfHeader::Builder& VcfHeader::Builder::add_basic_field(KeyType key, ValueType value)
{
    if (key != vcfspec::header::fileFormat) {
        header_.basic_fields_.emplace_back(std::move(key), std::move(value));
    }
    return *this;
}

VcfHeader::Builder& VcfHeader::Builder::add_structured_field(KeyType tag, StructuredField values)
{
    header_.structured_fields_.emplace_back(std::move(tag), std::move(values));
    return *this;
}

VcfHeader VcfHeader::Builder::build_once()
{
    return std::move(header_);
}

} // namespace varcanon
