#include "core/shared/types.h"

namespace dq {

QString documentStatusToString(DocumentStatus status)
{
    switch (status) {
    case DocumentStatus::Processing:    return QStringLiteral("processing");
    case DocumentStatus::ChunksCreated: return QStringLiteral("chunks_created");
    case DocumentStatus::Completed:     return QStringLiteral("completed");
    case DocumentStatus::Failed:        return QStringLiteral("failed");
    }
    return QStringLiteral("processing");
}

std::optional<DocumentStatus> documentStatusFromString(const QString& str)
{
    if (str == QLatin1String("processing"))     return DocumentStatus::Processing;
    if (str == QLatin1String("chunks_created")) return DocumentStatus::ChunksCreated;
    if (str == QLatin1String("completed"))      return DocumentStatus::Completed;
    if (str == QLatin1String("failed"))         return DocumentStatus::Failed;
    return std::nullopt;
}

QString roleTagToString(RoleTag role)
{
    switch (role) {
    case RoleTag::Owner:    return QStringLiteral("owner");
    case RoleTag::Staff:    return QStringLiteral("staff");
    case RoleTag::External: return QStringLiteral("external");
    }
    return QStringLiteral("external");
}

std::optional<RoleTag> roleTagFromString(const QString& str)
{
    const QString lowered = str.trimmed().toLower();
    if (lowered == QLatin1String("owner") || lowered == QLatin1String("business_owner")) {
        return RoleTag::Owner;
    }
    if (lowered == QLatin1String("staff") || lowered == QLatin1String("employee")) {
        return RoleTag::Staff;
    }
    if (lowered == QLatin1String("external") || lowered == QLatin1String("customer")) {
        return RoleTag::External;
    }
    return std::nullopt;
}

// ── VisibilitySet ───────────────────────────────────────────

VisibilitySet::VisibilitySet()
    : m_bits(bitFor(RoleTag::Owner))
{
}

VisibilitySet::VisibilitySet(std::initializer_list<RoleTag> roles)
    : m_bits(bitFor(RoleTag::Owner))
{
    for (RoleTag role : roles) {
        m_bits |= bitFor(role);
    }
}

int VisibilitySet::bitFor(RoleTag role)
{
    return 1 << static_cast<int>(role);
}

bool VisibilitySet::contains(RoleTag role) const
{
    return (m_bits & bitFor(role)) != 0;
}

void VisibilitySet::insert(RoleTag role)
{
    m_bits |= bitFor(role);
}

void VisibilitySet::remove(RoleTag role)
{
    if (role == RoleTag::Owner) {
        return;
    }
    m_bits &= ~bitFor(role);
}

VisibilitySet VisibilitySet::fromBits(int bits)
{
    VisibilitySet set;
    const int known = bitFor(RoleTag::Owner) | bitFor(RoleTag::Staff) | bitFor(RoleTag::External);
    set.m_bits = (bits & known) | bitFor(RoleTag::Owner);
    return set;
}

QStringList VisibilitySet::toStringList() const
{
    QStringList roles;
    for (RoleTag role : {RoleTag::Owner, RoleTag::Staff, RoleTag::External}) {
        if (contains(role)) {
            roles.append(roleTagToString(role));
        }
    }
    return roles;
}

VisibilitySet VisibilitySet::fromStringList(const QStringList& roles)
{
    VisibilitySet set;
    for (const QString& name : roles) {
        if (const auto role = roleTagFromString(name)) {
            set.insert(*role);
        }
    }
    return set;
}

// ── Customer queries ────────────────────────────────────────

QString customerQueryStatusToString(CustomerQueryStatus status)
{
    switch (status) {
    case CustomerQueryStatus::Pending:   return QStringLiteral("pending");
    case CustomerQueryStatus::Responded: return QStringLiteral("responded");
    case CustomerQueryStatus::Archived:  return QStringLiteral("archived");
    }
    return QStringLiteral("pending");
}

std::optional<CustomerQueryStatus> customerQueryStatusFromString(const QString& str)
{
    if (str == QLatin1String("pending"))   return CustomerQueryStatus::Pending;
    if (str == QLatin1String("responded")) return CustomerQueryStatus::Responded;
    if (str == QLatin1String("archived"))  return CustomerQueryStatus::Archived;
    return std::nullopt;
}

QString matchSourceToString(MatchSource source)
{
    switch (source) {
    case MatchSource::Semantic: return QStringLiteral("semantic");
    case MatchSource::Keyword:  return QStringLiteral("keyword");
    case MatchSource::Hybrid:   return QStringLiteral("hybrid");
    }
    return QStringLiteral("hybrid");
}

} // namespace dq
