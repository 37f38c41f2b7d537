// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef vcf_header_hpp
#define vcf_header_hpp

#include <string>
#include <vector>
#include <unordered_map>
#include <utility>

#include <boost/optional.hpp>

namespace varcanon {

/*
 The meta-information lines of a VCF plus its sample names.
 
 basic:      ##key=value
 structured: ##TAG=<ID=id,keyA=valueA,...>
 
 Both kinds of line may repeat and are kept in file order.
 */
class VcfHeader
{
public:
    class Builder;
    
    using KeyType         = std::string;
    using ValueType       = std::string;
    using StructuredField = std::unordered_map<KeyType, ValueType>;
    
    VcfHeader() = default;
    
    unsigned num_samples() const noexcept;
    const std::vector<std::string>& samples() const noexcept;
    
    // The first ##key=value line with this key
    boost::optional<ValueType> get(const KeyType& key) const;
    std::vector<ValueType> get_all(const KeyType& key) const;
    
    bool has_structured_field(const KeyType& tag, const ValueType& id) const noexcept;
    std::vector<StructuredField> structured_fields(const KeyType& tag) const;
    
    // search_key of the ##tag=<ID=id,...> line
    boost::optional<ValueType> find(const KeyType& tag, const ValueType& id, const KeyType& search_key) const;
    
private:
    std::vector<std::string> samples_;
    std::vector<std::pair<KeyType, ValueType>> basic_fields_;
    std::vector<std::pair<KeyType, StructuredField>> structured_fields_;
    
    const StructuredField* find_structured(const KeyType& tag, const ValueType& id) const noexcept;
};

bool has_info(const VcfHeader& header, const VcfHeader::ValueType& id);
bool has_format(const VcfHeader& header, const VcfHeader::ValueType& id);

class VcfHeader::Builder
{
public:
    Builder() = default;
    
    Builder& set_samples(std::vector<std::string> samples);
    Builder& add_basic_field(KeyType key, ValueType value);
    Builder& add_structured_field(KeyType tag, StructuredField values);
    
    VcfHeader build_once();
    
private:
    VcfHeader header_;
};

} // namespace varcanon

#endif
