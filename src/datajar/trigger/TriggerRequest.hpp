#pragma once

#include "core/Error.hpp"
#include "core/Node.hpp"
#include "mutation/TreeMutator.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace DJ {

/**
 * One inbound trigger: set `key` (a dotted path) to `value` interpreted as `type`.
 * Accepted types are text, number, boolean, dictionary and list.
 */
struct TriggerRequest {
    std::string key;
    std::string value;
    std::string type = "text";
};

// Reads key/value/type from a URL query string ("?key=a.b&value=1&type=number").
// Returns nullopt when there is no non-empty key. Other parameters are ignored.
[[nodiscard]] auto parseTriggerQuery(std::string_view query) -> std::optional<TriggerRequest>;

// The payload the request writes, InvalidType for an unsupported type.
[[nodiscard]] auto triggerPayload(TriggerRequest const& request) -> Expected<Payload>;

struct TriggerResult {
    DeepSetResult set;
    std::string   acknowledgement;
};

// Coerces the value and deep-sets it into `root`.
[[nodiscard]] auto applyTrigger(Nodes const& root, TriggerRequest const& request) -> Expected<TriggerResult>;

// URL that replays the request: base?key=..&value=..&type=..&action=set
[[nodiscard]] auto buildTriggerUrl(std::string_view base, TriggerRequest const& request) -> std::string;

[[nodiscard]] auto percentEncode(std::string_view text) -> std::string;
[[nodiscard]] auto percentDecode(std::string_view text) -> std::string;

/**
 * Holds trigger parameters until they are consumed. take() hands them out once
 * and clears them, so replaying the entry point does not apply the write again.
 */
class TriggerInbox {
public:
    void               post(std::string_view query);
    void               post(TriggerRequest request);
    [[nodiscard]] auto pending() const noexcept -> bool { return this->request_.has_value(); }
    [[nodiscard]] auto take() -> std::optional<TriggerRequest>;

private:
    std::optional<TriggerRequest> request_;
};

} // namespace DJ
