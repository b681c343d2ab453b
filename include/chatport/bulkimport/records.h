#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace chatport::bulkimport {

// Bulk-import format version written by this tool
inline constexpr std::int64_t kBulkImportVersion = 1;

/**
 * Record kinds in the order the importer requires them.
 * The enumerator value is the kind's ordinal.
 */
enum class RecordKind : int {
    Version = 0,
    Team,
    Channel,
    User,
    Post,
    DirectChannel,
    DirectPost
};

constexpr std::string_view recordKindName(RecordKind kind) {
    switch (kind) {
        case RecordKind::Version: return "version";
        case RecordKind::Team: return "team";
        case RecordKind::Channel: return "channel";
        case RecordKind::User: return "user";
        case RecordKind::Post: return "post";
        case RecordKind::DirectChannel: return "direct_channel";
        case RecordKind::DirectPost: return "direct_post";
    }
    return "unknown";
}

constexpr int ordinalOf(RecordKind kind) {
    return static_cast<int>(kind);
}

// ============================================================================
// Payloads
// ============================================================================

struct VersionRecord {
    std::int64_t version{kBulkImportVersion};
};

inline constexpr std::string_view kTeamTypeOpen = "O";
inline constexpr std::string_view kTeamTypeInviteOnly = "I";

struct TeamRecord {
    std::string name;
    std::string displayName;
    std::string type{kTeamTypeOpen};
    std::string description;
    std::optional<bool> allowOpenInvite;
    std::string scheme;
};

inline constexpr std::string_view kChannelTypePublic = "O";
inline constexpr std::string_view kChannelTypePrivate = "P";

struct ChannelRecord {
    std::string team;
    std::string name;
    std::string displayName;
    std::string type{kChannelTypePublic};
    std::string header;
    std::string purpose;
    std::string scheme;
};

inline constexpr std::string_view kUserRoleUser = "system_user";
inline constexpr std::string_view kUserRoleAdmin = "system_admin system_user";
inline constexpr std::string_view kTeamRoleUser = "team_user";
inline constexpr std::string_view kTeamRoleAdmin = "team_admin team_user";
inline constexpr std::string_view kChannelRoleUser = "channel_user";
inline constexpr std::string_view kChannelRoleAdmin = "channel_admin channel_user";

struct UserChannelMembership {
    std::string name;
    std::string roles;
    std::optional<bool> favorite;
};

struct UserTeamMembership {
    std::string name;
    std::string roles;
    std::vector<UserChannelMembership> channels;
};

struct UserRecord {
    std::string username;
    std::string email;
    std::string role;
    std::vector<UserTeamMembership> teams;
};

struct Reaction {
    std::string user;
    std::string emojiName;
    std::int64_t createAt{0}; // ms since epoch
};

struct Attachment {
    std::string path;
};

// Importer limit on attachments per post or reply
inline constexpr std::size_t kMaxAttachmentsPerPost = 5;

struct Reply {
    std::string user;
    std::string message;
    std::int64_t createAt{0}; // ms since epoch
    std::vector<std::string> flaggedBy;
    std::vector<Reaction> reactions;
    std::vector<Attachment> attachments;
};

struct PostRecord {
    std::string team;
    std::string channel;
    std::string user;
    std::string message;
    std::int64_t createAt{0}; // ms since epoch
    std::vector<std::string> flaggedBy;
    std::vector<Reply> replies;
    std::vector<Reaction> reactions;
    std::vector<Attachment> attachments;
};

struct DirectChannelRecord {
    std::vector<std::string> members;
    std::vector<std::string> favoritedBy;
    std::string header;
};

struct DirectPostRecord {
    std::vector<std::string> channelMembers;
    std::string user;
    std::string message;
    std::int64_t createAt{0}; // ms since epoch
    std::vector<std::string> flaggedBy;
    std::vector<Reply> replies;
    std::vector<Reaction> reactions;
    std::vector<Attachment> attachments;
};

/**
 * One bulk-import line. Alternative index == RecordKind ordinal.
 */
using Record = std::variant<VersionRecord, TeamRecord, ChannelRecord, UserRecord, PostRecord,
                            DirectChannelRecord, DirectPostRecord>;

RecordKind kindOf(const Record& record) noexcept;

/**
 * Serialize a record as {"type": "<kind>", "<kind>": {...}}.
 * Empty optional fields are omitted; "version" carries a bare integer.
 */
nlohmann::json toJson(const Record& record);

} // namespace chatport::bulkimport
