/**
 * @file ClaimHits.hpp
 * @brief Turns nearest-claim hits into claims with their document context.
 */

#pragma once
#include <vector>
#include "domain/PatentRepository.hpp"

namespace patentlens::application {

/**
 * @brief Looks up each neighbour's claim and owning document.
 * Hits whose claim no longer exists are skipped; order is preserved.
 */
std::vector<domain::ClaimHit> ResolveClaimHits(const domain::PatentRepository& repository,
                                               const std::vector<domain::ClaimNeighborHit>& neighbours);

} // namespace patentlens::application
