#include <chatport/bulkimport/records.h>

#include <type_traits>

namespace chatport::bulkimport {

using nlohmann::json;

namespace {

void putIfNotEmpty(json& j, const char* field, const std::string& value) {
    if (!value.empty())
        j[field] = value;
}

void putIfNotEmpty(json& j, const char* field, const std::vector<std::string>& values) {
    if (!values.empty())
        j[field] = values;
}

json reactionsJson(const std::vector<Reaction>& reactions) {
    json arr = json::array();
    for (const auto& r : reactions) {
        arr.push_back(
            json{{"user", r.user}, {"emoji_name", r.emojiName}, {"create_at", r.createAt}});
    }
    return arr;
}

json attachmentsJson(const std::vector<Attachment>& attachments) {
    json arr = json::array();
    for (const auto& a : attachments) {
        arr.push_back(json{{"path", a.path}});
    }
    return arr;
}

// Fields shared by posts, direct posts and replies
template <typename T> void putThreadFields(json& j, const T& p) {
    j["message"] = p.message;
    j["create_at"] = p.createAt;
    putIfNotEmpty(j, "flagged_by", p.flaggedBy);
    if (!p.reactions.empty())
        j["reactions"] = reactionsJson(p.reactions);
    if (!p.attachments.empty())
        j["attachments"] = attachmentsJson(p.attachments);
}

json replyJson(const Reply& r) {
    json j = json::object();
    j["user"] = r.user;
    putThreadFields(j, r);
    return j;
}

json repliesJson(const std::vector<Reply>& replies) {
    json arr = json::array();
    for (const auto& r : replies) {
        arr.push_back(replyJson(r));
    }
    return arr;
}

json payloadJson(const TeamRecord& t) {
    json j = {{"name", t.name}, {"display_name", t.displayName}, {"type", t.type}};
    putIfNotEmpty(j, "description", t.description);
    if (t.allowOpenInvite)
        j["allow_open_invite"] = *t.allowOpenInvite;
    putIfNotEmpty(j, "scheme", t.scheme);
    return j;
}

json payloadJson(const ChannelRecord& c) {
    json j = {{"team", c.team},
              {"name", c.name},
              {"display_name", c.displayName},
              {"type", c.type}};
    putIfNotEmpty(j, "header", c.header);
    putIfNotEmpty(j, "purpose", c.purpose);
    putIfNotEmpty(j, "scheme", c.scheme);
    return j;
}

json payloadJson(const UserRecord& u) {
    json j = {{"username", u.username}, {"email", u.email}};
    putIfNotEmpty(j, "role", u.role);
    if (!u.teams.empty()) {
        json teams = json::array();
        for (const auto& t : u.teams) {
            json tj = {{"name", t.name}};
            putIfNotEmpty(tj, "roles", t.roles);
            if (!t.channels.empty()) {
                json channels = json::array();
                for (const auto& c : t.channels) {
                    json cj = {{"name", c.name}};
                    putIfNotEmpty(cj, "roles", c.roles);
                    if (c.favorite)
                        cj["favorite"] = *c.favorite;
                    channels.push_back(std::move(cj));
                }
                tj["channels"] = std::move(channels);
            }
            teams.push_back(std::move(tj));
        }
        j["teams"] = std::move(teams);
    }
    return j;
}

json payloadJson(const PostRecord& p) {
    json j = {{"team", p.team}, {"channel", p.channel}, {"user", p.user}};
    putThreadFields(j, p);
    if (!p.replies.empty())
        j["replies"] = repliesJson(p.replies);
    return j;
}

json payloadJson(const DirectChannelRecord& c) {
    json j = {{"members", c.members}};
    putIfNotEmpty(j, "favorited_by", c.favoritedBy);
    putIfNotEmpty(j, "header", c.header);
    return j;
}

json payloadJson(const DirectPostRecord& p) {
    json j = {{"channel_members", p.channelMembers}, {"user", p.user}};
    putThreadFields(j, p);
    if (!p.replies.empty())
        j["replies"] = repliesJson(p.replies);
    return j;
}

} // namespace

RecordKind kindOf(const Record& record) noexcept {
    return static_cast<RecordKind>(record.index());
}

json toJson(const Record& record) {
    const std::string name{recordKindName(kindOf(record))};
    json line = json::object();
    line["type"] = name;
    std::visit(
        [&](const auto& r) {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, VersionRecord>) {
                line[name] = r.version;
            } else {
                line[name] = payloadJson(r);
            }
        },
        record);
    return line;
}

} // namespace chatport::bulkimport
