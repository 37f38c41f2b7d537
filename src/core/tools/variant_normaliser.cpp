// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "variant_normaliser.hpp"

#include <utility>
#include <sstream>

namespace varcanon {

VariantNormaliser::VariantNormaliser(const ReferenceGenome& reference)
: reference_ {reference}
{}

VariantKey VariantNormaliser::normalise_variant(const VariantKey& variant) const
{
    return normalise(variant, 0);
}

VariantKey VariantNormaliser::normalise_insertion(const VariantKey& variant) const
{
    return normalise(variant, 1);
}

VariantKey VariantNormaliser::normalise(const VariantKey& variant, const std::size_t min_size) const
{
    if (variant.ref() == variant.alt()) return variant; // no edit, nothing to anchor on
    return trim_left(shift_left(variant, reference_), min_size);
}

namespace {

char fetch_left_base(const VariantKey& current, const ReferenceGenome& reference)
{
    if (!reference.has_contig(current.contig())) {
        throw ReferenceLookupError {current, "the contig is not in the reference"};
    }
    if (current.pos() == 0) {
        throw ReferenceLookupError {current, "the variant cannot be extended past the start of the contig"};
    }
    if (current.pos() > reference.contig_size(current.contig())) {
        throw ReferenceLookupError {current, "the position is outside the contig"};
    }
    return reference.base_at(current.contig(), current.pos() - 1);
}

} // namespace

VariantKey shift_left(const VariantKey& variant, const ReferenceGenome& reference)
{
    auto pos = variant.pos();
    auto ref = variant.ref();
    auto alt = variant.alt();
    bool changed {true};
    while (changed) {
        changed = false;
        if (!ref.empty() && !alt.empty() && ref.back() == alt.back()) {
            ref.pop_back();
            alt.pop_back();
            changed = true;
        }
        if (ref.empty() || alt.empty()) {
            const auto base = fetch_left_base(VariantKey {variant.contig(), pos, ref, alt}, reference);
            ref.insert(ref.begin(), base);
            alt.insert(alt.begin(), base);
            --pos;
            changed = true;
        }
    }
    return VariantKey {variant.contig(), pos, std::move(ref), std::move(alt)};
}

VariantKey trim_left(const VariantKey& variant, const std::size_t min_size)
{
    const auto& ref = variant.ref();
    const auto& alt = variant.alt();
    std::size_t n {0};
    while (ref.size() - n > min_size && alt.size() - n > min_size && ref[n] == alt[n]) {
        ++n;
    }
    if (n == 0) return variant;
    return VariantKey {variant.contig(), variant.pos() + static_cast<VariantKey::Position>(n),
                       ref.substr(n), alt.substr(n)};
}

// ReferenceLookupError

ReferenceLookupError::ReferenceLookupError(VariantKey variant, std::string reason)
: variant_ {std::move(variant)}
, reason_ {std::move(reason)}
{}

const VariantKey& ReferenceLookupError::variant() const noexcept
{
    return variant_;
}

std::string ReferenceLookupError::do_where() const
{
    return "VariantNormaliser";
}

std::string ReferenceLookupError::do_why() const
{
    std::ostringstream ss {};
    ss << "Could not normalise the variant " << variant_ << " because " << reason_;
    return ss.str();
}

std::string ReferenceLookupError::do_help() const
{
    return "check the reference given with --ref-path is the one the input files were made against";
}

} // namespace varcanon
