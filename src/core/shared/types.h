#pragma once

#include <QString>
#include <QStringList>

#include <cstdint>
#include <initializer_list>
#include <optional>

namespace dq {

// Processing status of an uploaded document.
// Forward-only: processing -> chunks_created -> completed, failed from anywhere.
enum class DocumentStatus {
    Processing,
    ChunksCreated,
    Completed,
    Failed,
};

QString documentStatusToString(DocumentStatus status);
std::optional<DocumentStatus> documentStatusFromString(const QString& str);

// Caller category. "business_owner", "employee" and "customer" are accepted
// as aliases when parsing.
enum class RoleTag {
    Owner,
    Staff,
    External,
};

QString roleTagToString(RoleTag role);
std::optional<RoleTag> roleTagFromString(const QString& str);

// Set of roles a document is visible to. The owner tag is always a member.
class VisibilitySet {
public:
    VisibilitySet();
    VisibilitySet(std::initializer_list<RoleTag> roles);

    bool contains(RoleTag role) const;
    void insert(RoleTag role);
    void remove(RoleTag role);

    // Bitmask persisted in the documents table; bit n is RoleTag value n.
    int bits() const { return m_bits; }
    static VisibilitySet fromBits(int bits);
    static int bitFor(RoleTag role);

    QStringList toStringList() const;
    static VisibilitySet fromStringList(const QStringList& roles);

    bool operator==(const VisibilitySet& other) const { return m_bits == other.m_bits; }
    bool operator!=(const VisibilitySet& other) const { return m_bits != other.m_bits; }

private:
    int m_bits = 0;
};

enum class CustomerQueryStatus {
    Pending,
    Responded,
    Archived,
};

QString customerQueryStatusToString(CustomerQueryStatus status);
std::optional<CustomerQueryStatus> customerQueryStatusFromString(const QString& str);

// Which retrieval path produced a ranked passage.
enum class MatchSource {
    Semantic,
    Keyword,
    Hybrid,
};

QString matchSourceToString(MatchSource source);

} // namespace dq
