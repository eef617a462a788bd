#pragma once

#include <regex>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace zonesync::endpoint {

/// Decides whether a DNS name is inside the set of names this installation
/// may manage. A filter holds either suffix rules or regex rules, never both;
/// a filter with no rules matches every name.
///
/// Suffix rules: "example.org" matches the apex and its subdomains,
/// ".example.org" matches subdomains only.
///
/// JSON form: {"include": [...], "exclude": [...]} or
///            {"regexInclude": "...", "regexExclude": "..."}
/// Class abbreviation: df
class DomainFilter {
 public:
  struct SuffixRules {
    std::vector<std::string> vInclude;  // normalized, sorted, no empties
    std::vector<std::string> vExclude;
  };

  struct RegexRules {
    std::string sInclude;  // source patterns, "" when absent
    std::string sExclude;
    std::regex reInclude;
    std::regex reExclude;
  };

  /// Unconfigured filter: matches everything.
  DomainFilter();

  /// Suffix-mode filter. Rules are normalized; empty and blank rules are dropped.
  explicit DomainFilter(const std::vector<std::string>& vInclude,
                        const std::vector<std::string>& vExclude = {});

  /// Regex-mode filter. An empty pattern means "absent".
  /// Throws ConfigurationError naming the offending key on an invalid pattern.
  static DomainFilter fromRegex(const std::string& sInclude, const std::string& sExclude);

  /// Deserialize the JSON form. Throws ConfigurationError on mixed modes,
  /// invalid patterns or mistyped keys.
  static DomainFilter fromJson(const nlohmann::json& jFilter);

  nlohmann::json toJson() const;

  /// True iff the name is included and not excluded.
  bool match(const std::string& sName) const;

  /// True iff the name equals or is a dot-delimited ancestor of an inclusion
  /// rule, i.e. it is a viable parent zone for a managed name.
  bool matchParent(const std::string& sName) const;

  bool isConfigured() const;
  bool isRegex() const { return std::holds_alternative<RegexRules>(_vRules); }

  /// Trim, strip one trailing dot, lower-case and IDNA-normalize a name
  /// to its Unicode form so that "xn--" and native spellings compare equal.
  static std::string normalizeDomain(const std::string& sName);

  /// Normalize a rule list, dropping rules that end up empty.
  static std::vector<std::string> prepareFilters(const std::vector<std::string>& vRules);

 private:
  std::variant<SuffixRules, RegexRules> _vRules;
};

void to_json(nlohmann::json& j, const DomainFilter& df);
void from_json(const nlohmann::json& j, DomainFilter& df);

}  // namespace zonesync::endpoint
