/**
 * @file ClaimHits.cpp
 * @brief Resolving claim neighbours into scored hits.
 */

#include "application/ClaimHits.hpp"
#include "domain/SimilarityFusion.hpp"
#include <algorithm>
#include <map>

namespace patentlens::application {

std::vector<domain::ClaimHit> ResolveClaimHits(const domain::PatentRepository& repository,
                                               const std::vector<domain::ClaimNeighborHit>& neighbours) {
    std::map<std::string, std::vector<domain::Claim>> claimsByDocument;
    std::map<std::string, std::optional<domain::Document>> documents;
    std::vector<domain::ClaimHit> hits;
    hits.reserve(neighbours.size());

    for (const auto& neighbour : neighbours) {
        if (!claimsByDocument.count(neighbour.documentId)) {
            claimsByDocument[neighbour.documentId] = repository.claimsFor(neighbour.documentId);
            documents[neighbour.documentId] = repository.findDocument(neighbour.documentId);
        }
        const auto& claims = claimsByDocument[neighbour.documentId];
        auto it = std::find_if(claims.begin(), claims.end(),
                               [&](const domain::Claim& c) { return c.number == neighbour.claimNumber; });
        if (it == claims.end()) continue;

        domain::ClaimHit hit;
        hit.claim = *it;
        hit.similarity = domain::SimilarityFusion::SimilarityFromDistance(neighbour.distance);
        if (const auto& document = documents[neighbour.documentId]) {
            hit.documentTitle = document->title;
            hit.patentNumber = document->patentNumber;
        }
        hits.push_back(std::move(hit));
    }
    return hits;
}

} // namespace patentlens::application
