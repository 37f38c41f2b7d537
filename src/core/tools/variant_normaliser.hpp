// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef variant_normaliser_hpp
#define variant_normaliser_hpp

#include <string>
#include <cstddef>
#include <functional>

#include "exceptions/user_error.hpp"
#include "io/reference/reference_genome.hpp"
#include "core/types/variant_key.hpp"

namespace varcanon {

/*
 Brings variants into the canonical form used as the database key, see
 http://genome.sph.umich.edu/wiki/Variant_Normalization.
 
 Variants are first shifted left: a shared trailing base is removed from both
 alleles and, whenever an allele becomes empty, both alleles are extended by
 the reference base to their left. Then shared leading bases are trimmed while
 both alleles are longer than the requested minimum size.
 
 Any two descriptions of the same edit normalise to the same VariantKey.
 */
class VariantNormaliser
{
public:
    VariantNormaliser() = delete;
    
    VariantNormaliser(const ReferenceGenome& reference);
    
    VariantNormaliser(const VariantNormaliser&)            = default;
    VariantNormaliser& operator=(const VariantNormaliser&) = default;
    VariantNormaliser(VariantNormaliser&&)                 = default;
    VariantNormaliser& operator=(VariantNormaliser&&)      = default;
    
    ~VariantNormaliser() = default;
    
    // Fully trimmed, so pure indels have an empty allele
    VariantKey normalise_variant(const VariantKey& variant) const;
    
    // Keeps one anchor base so neither allele is empty
    VariantKey normalise_insertion(const VariantKey& variant) const;
    
    VariantKey normalise(const VariantKey& variant, std::size_t min_size) const;
    
private:
    std::reference_wrapper<const ReferenceGenome> reference_;
};

VariantKey shift_left(const VariantKey& variant, const ReferenceGenome& reference);

VariantKey trim_left(const VariantKey& variant, std::size_t min_size);

/*
 Normalisation needed a reference base that does not exist. This means the
 reference does not match the input data.
 */
class ReferenceLookupError : public UserError
{
public:
    using ContigName = VariantKey::ContigName;
    using Position   = VariantKey::Position;
    
    ReferenceLookupError(VariantKey variant, std::string reason);
    
    const VariantKey& variant() const noexcept;
    
private:
    std::string do_where() const override;
    std::string do_why() const override;
    std::string do_help() const override;
    
    VariantKey variant_;
    std::string reason_;
};

} // namespace varcanon

#endif
