#include "scoring/Evidence.hpp"

namespace scoring {

nlohmann::json EvidenceQuote::to_json() const {
    nlohmann::json j;
    j["evidence_id"] = evidence_id;
    j["doc_id"] = doc_id;
    j["theme"] = theme;
    j["quote"] = quote;
    j["content_hash"] = content_hash;
    j["published_at"] = published_at;
    j["page"] = page;
    j["offset"] = offset;
    j["matched_stage"] = matched_stage;
    return j;
}

nlohmann::json StageScore::to_json() const {
    nlohmann::json j;
    j["theme"] = theme;
    j["stage"] = stage;
    j["confidence"] = confidence;
    j["evidence_ids"] = evidence_ids;
    j["snapshot_id"] = snapshot_id;
    j["org_id"] = org_id;
    j["year"] = year;
    j["audit"] = audit;
    j["confidence_label"] = confidence_label;
    j["frameworks"] = frameworks;
    j["cited_doc_ids"] = cited_doc_ids;
    return j;
}

std::string maturity_label(double average_stage) {
    if (average_stage < 1.0) return "Nascent";
    if (average_stage < 2.0) return "Emerging";
    if (average_stage < 3.0) return "Established";
    if (average_stage < 3.6) return "Advanced";
    return "Leading";
}

}  // namespace scoring
