#include "trigger/TriggerRequest.hpp"
#include "log/TaggedLogger.hpp"

#include <utility>

namespace DJ {

namespace {

auto isUnreserved(char c) -> bool {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '*' || c == '-' || c == '.'
           || c == '_';
}

auto hexValue(char c) -> int {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

auto percentEncode(std::string_view text) -> std::string {
    constexpr char hex[] = "0123456789ABCDEF";
    std::string    encoded;
    encoded.reserve(text.size());
    for (char c : text) {
        if (isUnreserved(c)) {
            encoded.push_back(c);
        } else if (c == ' ') {
            encoded.push_back('+');
        } else {
            auto const byte = static_cast<unsigned char>(c);
            encoded.push_back('%');
            encoded.push_back(hex[byte >> 4]);
            encoded.push_back(hex[byte & 0x0F]);
        }
    }
    return encoded;
}

auto percentDecode(std::string_view text) -> std::string {
    std::string decoded;
    decoded.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        char const c = text[i];
        if (c == '+') {
            decoded.push_back(' ');
            continue;
        }
        if (c == '%' && i + 2 < text.size() && hexValue(text[i + 1]) >= 0 && hexValue(text[i + 2]) >= 0) {
            decoded.push_back(static_cast<char>(hexValue(text[i + 1]) * 16 + hexValue(text[i + 2])));
            i += 2;
            continue;
        }
        decoded.push_back(c);
    }
    return decoded;
}

auto parseTriggerQuery(std::string_view query) -> std::optional<TriggerRequest> {
    if (auto const mark = query.find('?'); mark != std::string_view::npos)
        query.remove_prefix(mark + 1);
    if (auto const hash = query.find('#'); hash != std::string_view::npos)
        query = query.substr(0, hash);

    std::optional<std::string> key;
    std::optional<std::string> value;
    std::optional<std::string> type;

    while (!query.empty()) {
        auto const amp   = query.find('&');
        auto const pair  = query.substr(0, amp);
        auto const eq    = pair.find('=');
        auto const name  = percentDecode(pair.substr(0, eq));
        auto const param = eq == std::string_view::npos ? std::string{} : percentDecode(pair.substr(eq + 1));

        // The first occurrence of a parameter wins.
        if (name == "key" && !key)
            key = param;
        else if (name == "value" && !value)
            value = param;
        else if (name == "type" && !type)
            type = param;

        if (amp == std::string_view::npos)
            break;
        query.remove_prefix(amp + 1);
    }

    if (!key || key->empty())
        return std::nullopt;

    TriggerRequest request;
    request.key   = std::move(*key);
    request.value = value.value_or("");
    if (type && !type->empty())
        request.type = std::move(*type);
    return request;
}

auto triggerPayload(TriggerRequest const& request) -> Expected<Payload> {
    auto const kind = parseKind(request.type);
    if (!kind || *kind == NodeKind::Expression)
        return std::unexpected(Error{Error::Code::InvalidType, "Unsupported trigger type '" + request.type + "'"});
    return coerceValue(*kind, request.value);
}

auto applyTrigger(Nodes const& root, TriggerRequest const& request) -> Expected<TriggerResult> {
    auto payload = triggerPayload(request);
    if (!payload)
        return std::unexpected(payload.error());

    auto set = deepSet(root, request.key, std::move(*payload));
    if (!set)
        return std::unexpected(set.error());

    TriggerResult result{std::move(*set), {}};
    if (result.set.outcome == DeepSetOutcome::Blocked)
        result.acknowledgement = "Key \"" + request.key + "\" is blocked by an existing value";
    else
        result.acknowledgement = "Updated key \"" + request.key + "\"";
    dj_log(result.acknowledgement, "Trigger");
    return result;
}

auto buildTriggerUrl(std::string_view base, TriggerRequest const& request) -> std::string {
    std::string url{base};
    url += "?key=" + percentEncode(request.key);
    url += "&value=" + percentEncode(request.value);
    url += "&type=" + percentEncode(request.type);
    url += "&action=set";
    return url;
}

void TriggerInbox::post(std::string_view query) {
    this->request_ = parseTriggerQuery(query);
}

void TriggerInbox::post(TriggerRequest request) {
    if (request.key.empty()) {
        this->request_.reset();
        return;
    }
    this->request_ = std::move(request);
}

auto TriggerInbox::take() -> std::optional<TriggerRequest> {
    auto request = std::move(this->request_);
    this->request_.reset();
    return request;
}

} // namespace DJ
