/*
 @ 0xCCCCCCCC
*/

#include "shield_engine/filter_rule.h"

#include <map>

#include "kbase/error_exception_util.h"

#include "shield_engine/engine_errors.h"

namespace {

using sse::DomainScope;
using sse::ResourceFlag;

constexpr const char kExceptionPrefix[] = "@@";

// Types absent here, e.g. `document` or `other`, are gated by no flag.
const std::map<std::string, unsigned int> kResourceTypeMap {
    { "script", ResourceFlag::SCRIPT },
    { "image", ResourceFlag::IMAGE },
    { "stylesheet", ResourceFlag::STYLESHEET },
    { "xmlhttprequest", ResourceFlag::XMLHTTPREQUEST },
    { "subdocument", ResourceFlag::SUBDOCUMENT }
};

void WriteDomainScope(kbase::Pickle& pickle, const DomainScope& scope)
{
    pickle << scope.specified << static_cast<uint32_t>(scope.domains.size());
    for (const auto& domain : scope.domains) {
        pickle << domain;
    }
}

DomainScope ReadDomainScope(kbase::PickleReader& reader)
{
    bool specified = false;
    uint32_t count = 0;
    reader >> specified >> count;

    std::set<std::string> domains;
    for (uint32_t i = 0; i < count; ++i) {
        std::string domain;
        reader >> domain;
        domains.insert(std::move(domain));
    }

    return specified ? DomainScope(std::move(domains)) : DomainScope();
}

}   // namespace

namespace sse {

DomainScope::DomainScope()
    : specified(false)
{}

DomainScope::DomainScope(std::set<std::string> names)
    : specified(true), domains(std::move(names))
{}

bool DomainScope::Contains(const std::string& domain) const
{
    return domains.count(domain) > 0;
}

Rule::Rule(RuleKind kind, std::string pattern)
    : kind(kind),
      pattern(std::move(pattern)),
      resource_flags(kAllResourceFlags)
{
    ENSURE(RAISE, !this->pattern.empty()).Require<InvalidArgumentError>();
}

bool operator==(const Rule& lhs, const Rule& rhs)
{
    return lhs.kind == rhs.kind &&
           lhs.pattern == rhs.pattern &&
           lhs.domains.specified == rhs.domains.specified &&
           lhs.domains.domains == rhs.domains.domains &&
           lhs.exceptions.specified == rhs.exceptions.specified &&
           lhs.exceptions.domains == rhs.exceptions.domains &&
           lhs.resource_flags == rhs.resource_flags;
}

const char* RuleKindName(RuleKind kind)
{
    switch (kind) {
        case RuleKind::BLOCK:
            return "block";

        case RuleKind::ALLOW:
            return "allow";

        case RuleKind::HIDE:
            return "hide";

        case RuleKind::REDIRECT:
            return "redirect";

        default:
            ENSURE(CHECK, kbase::NotReached())(static_cast<unsigned int>(kind)).Require();
            return "";
    }
}

bool AppliesOnResourceType(unsigned int resource_flags, const std::string& resource_type)
{
    auto it = kResourceTypeMap.find(resource_type);
    if (it == kResourceTypeMap.end()) {
        return true;
    }

    return (resource_flags & it->second) != 0;
}

bool AppliesOnRequest(const Rule& rule, const std::string& origin_domain,
                      const std::string& resource_type)
{
    if (rule.domains.specified && !rule.domains.Contains(origin_domain)) {
        return false;
    }

    if (rule.exceptions.specified && rule.exceptions.Contains(origin_domain)) {
        return false;
    }

    return AppliesOnResourceType(rule.resource_flags, resource_type);
}

std::string RuleToText(const Rule& rule)
{
    if (rule.kind == RuleKind::ALLOW) {
        return kExceptionPrefix + rule.pattern;
    }

    return rule.pattern;
}

kbase::Pickle& operator<<(kbase::Pickle& pickle, const Rule& rule)
{
    pickle << static_cast<unsigned int>(rule.kind) << rule.pattern;
    WriteDomainScope(pickle, rule.domains);
    WriteDomainScope(pickle, rule.exceptions);
    pickle << rule.resource_flags;
    return pickle;
}

Rule ReadRule(kbase::PickleReader& reader)
{
    unsigned int kind = 0;
    std::string pattern;
    reader >> kind >> pattern;
    ENSURE(RAISE, kind <= static_cast<unsigned int>(RuleKind::REDIRECT) && !pattern.empty())
          (kind)(pattern).Require<SnapshotError>();

    Rule rule(static_cast<RuleKind>(kind), std::move(pattern));
    rule.domains = ReadDomainScope(reader);
    rule.exceptions = ReadDomainScope(reader);
    reader >> rule.resource_flags;

    return rule;
}

}   // namespace sse
