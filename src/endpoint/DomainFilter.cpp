#include "endpoint/DomainFilter.hpp"

#include "common/Errors.hpp"

#include <idn2.h>

#include <algorithm>
#include <memory>

namespace zonesync::endpoint {

namespace {

using IdnString = std::unique_ptr<char, decltype(&idn2_free)>;

constexpr const char* kListAndRegexError = "cannot have both domain list and regex";

bool isAscii(const std::string& s) {
  return std::all_of(s.begin(), s.end(),
                     [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}

bool endsWith(const std::string& s, const std::string& sSuffix) {
  return s.size() >= sSuffix.size() &&
         s.compare(s.size() - sSuffix.size(), sSuffix.size(), sSuffix) == 0;
}

// ── IDNA ───────────────────────────────────────────────────────────────────

/// Unicode form of one lower-cased label. Labels IDNA rejects are kept as given.
std::string normalizeLabel(const std::string& sLabel) {
  if (sLabel.empty()) {
    return sLabel;
  }

  std::string sAce = sLabel;
  if (!isAscii(sLabel)) {
    // TR46 mapping folds case for non-ASCII characters too
    char* pAscii = nullptr;
    if (idn2_to_ascii_8z(sLabel.c_str(), &pAscii, IDN2_NFC_INPUT | IDN2_NONTRANSITIONAL) !=
        IDN2_OK) {
      return sLabel;
    }
    IdnString upAscii(pAscii, &idn2_free);
    sAce = upAscii.get();
  }

  if (sAce.rfind("xn--", 0) != 0) {
    return sAce;
  }

  char* pUnicode = nullptr;
  if (idn2_to_unicode_8z8z(sAce.c_str(), &pUnicode, 0) != IDN2_OK) {
    return sAce;
  }
  IdnString upUnicode(pUnicode, &idn2_free);
  return std::string(upUnicode.get());
}

// ── Suffix rules ───────────────────────────────────────────────────────────

bool matchSuffixRules(const std::vector<std::string>& vRules, const std::string& sName,
                      bool bEmptyValue) {
  if (vRules.empty()) {
    return bEmptyValue;
  }
  for (const auto& sRule : vRules) {
    if (sRule.front() == '.') {
      // Subdomains only, never the apex
      if (endsWith(sName, sRule)) return true;
    } else if (sName == sRule || endsWith(sName, "." + sRule)) {
      return true;
    }
  }
  return false;
}

std::regex compilePattern(const std::string& sPattern, const char* pKey) {
  try {
    return std::regex(sPattern, std::regex::ECMAScript);
  } catch (const std::regex_error& ex) {
    throw common::ConfigurationError("invalid_filter",
                                     std::string("invalid ") + pKey + ": " + ex.what());
  }
}

// ── JSON helpers ───────────────────────────────────────────────────────────

std::vector<std::string> readStringList(const nlohmann::json& jFilter, const char* pKey) {
  if (!jFilter.contains(pKey) || jFilter[pKey].is_null()) {
    return {};
  }
  const auto& jValue = jFilter[pKey];
  if (!jValue.is_array() ||
      !std::all_of(jValue.begin(), jValue.end(), [](const auto& j) { return j.is_string(); })) {
    throw common::ConfigurationError(
        "invalid_filter", std::string("invalid ") + pKey + ": expected an array of strings");
  }
  return jValue.get<std::vector<std::string>>();
}

std::string readString(const nlohmann::json& jFilter, const char* pKey) {
  if (!jFilter.contains(pKey) || jFilter[pKey].is_null()) {
    return {};
  }
  if (!jFilter[pKey].is_string()) {
    throw common::ConfigurationError("invalid_filter",
                                     std::string("invalid ") + pKey + ": expected a string");
  }
  return jFilter[pKey].get<std::string>();
}

}  // anonymous namespace

// ── DomainFilter ───────────────────────────────────────────────────────────

DomainFilter::DomainFilter() : _vRules(SuffixRules{}) {}

DomainFilter::DomainFilter(const std::vector<std::string>& vInclude,
                           const std::vector<std::string>& vExclude)
    : _vRules(SuffixRules{prepareFilters(vInclude), prepareFilters(vExclude)}) {}

DomainFilter DomainFilter::fromRegex(const std::string& sInclude, const std::string& sExclude) {
  RegexRules rr;
  rr.sInclude = sInclude;
  rr.sExclude = sExclude;
  if (!sInclude.empty()) {
    rr.reInclude = compilePattern(sInclude, "regexInclude");
  }
  if (!sExclude.empty()) {
    rr.reExclude = compilePattern(sExclude, "regexExclude");
  }

  DomainFilter df;
  df._vRules = std::move(rr);
  return df;
}

DomainFilter DomainFilter::fromJson(const nlohmann::json& jFilter) {
  if (jFilter.is_null()) {
    return DomainFilter();
  }
  if (!jFilter.is_object()) {
    throw common::ConfigurationError("invalid_filter", "domain filter must be a JSON object");
  }

  auto vInclude = readStringList(jFilter, "include");
  auto vExclude = readStringList(jFilter, "exclude");
  const auto sRegexInclude = readString(jFilter, "regexInclude");
  const auto sRegexExclude = readString(jFilter, "regexExclude");

  if (sRegexInclude.empty() && sRegexExclude.empty()) {
    return DomainFilter(vInclude, vExclude);
  }
  if (!vInclude.empty() || !vExclude.empty()) {
    throw common::ConfigurationError("invalid_filter", kListAndRegexError);
  }
  return fromRegex(sRegexInclude, sRegexExclude);
}

nlohmann::json DomainFilter::toJson() const {
  nlohmann::json jFilter = nlohmann::json::object();
  if (const auto* pSuffix = std::get_if<SuffixRules>(&_vRules)) {
    if (!pSuffix->vInclude.empty()) jFilter["include"] = pSuffix->vInclude;
    if (!pSuffix->vExclude.empty()) jFilter["exclude"] = pSuffix->vExclude;
  } else {
    const auto& rr = std::get<RegexRules>(_vRules);
    if (!rr.sInclude.empty()) jFilter["regexInclude"] = rr.sInclude;
    if (!rr.sExclude.empty()) jFilter["regexExclude"] = rr.sExclude;
  }
  return jFilter;
}

bool DomainFilter::match(const std::string& sName) const {
  const std::string sNormalized = normalizeDomain(sName);

  if (const auto* pSuffix = std::get_if<SuffixRules>(&_vRules)) {
    return matchSuffixRules(pSuffix->vInclude, sNormalized, true) &&
           !matchSuffixRules(pSuffix->vExclude, sNormalized, false);
  }

  const auto& rr = std::get<RegexRules>(_vRules);
  if (!rr.sExclude.empty() && std::regex_search(sNormalized, rr.reExclude)) {
    return false;
  }
  return rr.sInclude.empty() || std::regex_search(sNormalized, rr.reInclude);
}

bool DomainFilter::matchParent(const std::string& sName) const {
  const std::string sNormalized = normalizeDomain(sName);

  if (const auto* pRegex = std::get_if<RegexRules>(&_vRules)) {
    // No suffix rules to be a parent of; only the exclusion applies
    return pRegex->sExclude.empty() || !std::regex_search(sNormalized, pRegex->reExclude);
  }

  const auto& sr = std::get<SuffixRules>(_vRules);
  if (matchSuffixRules(sr.vExclude, sNormalized, false)) {
    return false;
  }
  if (sr.vInclude.empty()) {
    return true;
  }
  for (const auto& sRule : sr.vInclude) {
    if (sRule.front() == '.') {
      continue;
    }
    if (sRule == sNormalized || endsWith(sRule, "." + sNormalized)) {
      return true;
    }
  }
  return false;
}

bool DomainFilter::isConfigured() const {
  if (const auto* pSuffix = std::get_if<SuffixRules>(&_vRules)) {
    return !pSuffix->vInclude.empty() || !pSuffix->vExclude.empty();
  }
  const auto& rr = std::get<RegexRules>(_vRules);
  return !rr.sInclude.empty() || !rr.sExclude.empty();
}

std::string DomainFilter::normalizeDomain(const std::string& sName) {
  const auto nFirst = sName.find_first_not_of(" \t\r\n");
  if (nFirst == std::string::npos) {
    return {};
  }
  const auto nLast = sName.find_last_not_of(" \t\r\n");
  std::string sTrimmed = sName.substr(nFirst, nLast - nFirst + 1);
  if (!sTrimmed.empty() && sTrimmed.back() == '.') {
    sTrimmed.pop_back();
  }
  for (auto& c : sTrimmed) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }

  std::string sResult;
  sResult.reserve(sTrimmed.size());
  size_t nStart = 0;
  while (true) {
    const auto nDot = sTrimmed.find('.', nStart);
    sResult += normalizeLabel(sTrimmed.substr(nStart, nDot - nStart));
    if (nDot == std::string::npos) {
      break;
    }
    sResult += '.';
    nStart = nDot + 1;
  }
  return sResult;
}

std::vector<std::string> DomainFilter::prepareFilters(const std::vector<std::string>& vRules) {
  std::vector<std::string> vPrepared;
  vPrepared.reserve(vRules.size());
  for (const auto& sRule : vRules) {
    auto sNormalized = normalizeDomain(sRule);
    if (!sNormalized.empty()) {
      vPrepared.push_back(std::move(sNormalized));
    }
  }
  std::sort(vPrepared.begin(), vPrepared.end());
  vPrepared.erase(std::unique(vPrepared.begin(), vPrepared.end()), vPrepared.end());
  return vPrepared;
}

void to_json(nlohmann::json& j, const DomainFilter& df) { j = df.toJson(); }

void from_json(const nlohmann::json& j, DomainFilter& df) { df = DomainFilter::fromJson(j); }

}  // namespace zonesync::endpoint
