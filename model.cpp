#include "mulegraph/model.hpp"
#include "mulegraph/errors.hpp"

namespace mulegraph {

std::string labelToString(AccountLabel label) {
  switch (label) {
    case AccountLabel::INTERNAL: return "internal";
    case AccountLabel::EXTERNAL: return "external";
    case AccountLabel::HIGH_RISK_JURISDICTION: return "high-risk-jurisdiction";
    case AccountLabel::FLAGGED: return "flagged";
    case AccountLabel::CONFIRMED_MULE: return "confirmed-mule";
    default: return "unknown";
  }
}

AccountLabel labelFromString(const std::string& value) {
  if (value == "internal") return AccountLabel::INTERNAL;
  if (value == "external") return AccountLabel::EXTERNAL;
  if (value == "high-risk-jurisdiction") return AccountLabel::HIGH_RISK_JURISDICTION;
  if (value == "flagged") return AccountLabel::FLAGGED;
  if (value == "confirmed-mule") return AccountLabel::CONFIRMED_MULE;
  throw GraphLoadError("Unknown account label: " + value);
}

}  // namespace mulegraph
