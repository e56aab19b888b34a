#include "memobuild/artifact.hpp"

#include "memobuild/fingerprint.hpp"

#include <nlohmann/json.hpp>

namespace memobuild {

namespace {
constexpr int action_record_version = 1;
}

Artifact Artifact::from_bytes(std::string data) {
    Artifact a;
    a.digest = fingerprint_bytes(data);
    a.data = std::move(data);
    return a;
}

nlohmann::json ActionRecord::to_json() const {
    return {{"version", action_record_version},
            {"node", node_digest.hex()},
            {"output", output_digest.hex()},
            {"size", size},
            {"created_at", created_at}};
}

std::string ActionRecord::encode() const {
    return to_json().dump();
}

Result<ActionRecord> ActionRecord::decode(std::string_view text) {
    try {
        auto doc = nlohmann::json::parse(text);
        if (doc.value("version", 0) != action_record_version) {
            return failf(ErrorKind::ParseError, "Unsupported action record version {}", doc.value("version", 0));
        }
        auto node = Digest::from_hex(doc.at("node").get<std::string>());
        if (!node)
            return std::unexpected(node.error());
        auto output = Digest::from_hex(doc.at("output").get<std::string>());
        if (!output)
            return std::unexpected(output.error());

        ActionRecord record;
        record.node_digest = *node;
        record.output_digest = *output;
        record.size = doc.value("size", uint64_t{0});
        record.created_at = doc.value("created_at", int64_t{0});
        return record;
    } catch (const nlohmann::json::exception &err) {
        return failf(ErrorKind::ParseError, "Malformed action record: {}", err.what());
    }
}

Result<void> verify_content(const Digest &key, std::string_view data) {
    Digest actual = fingerprint_bytes(data);
    if (actual != key) {
        return failf(ErrorKind::CASIntegrityFailure, "expected {}, got {} (size: {} bytes)", key.hex(), actual.hex(),
                     data.size());
    }
    return {};
}

Result<void> verify_action(const Digest &key, const ActionRecord &record) {
    if (record.node_digest != key) {
        return failf(ErrorKind::CASIntegrityFailure, "action record for {} is keyed as {}", record.node_digest.hex(),
                     key.hex());
    }
    return {};
}

int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace memobuild
