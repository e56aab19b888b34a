#include "memobuild/build_file.hpp"

#include "memobuild/fingerprint.hpp"
#include "memobuild/log.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace memobuild {

namespace {

constexpr int build_file_version = 1;

Result<NodeSpec> parse_step(const nlohmann::json &step, const BuildGraph &graph, const fs::path &root,
                            WorkerPool *pool) {
    NodeSpec spec;
    spec.name = step.at("name").get<std::string>();
    if (spec.name.empty())
        return fail(ErrorKind::ParseError, "Step without a name");

    bool has_source = step.contains("source");
    bool has_content = step.contains("content");
    bool has_digest = step.contains("digest");
    if (static_cast<int>(has_source) + static_cast<int>(has_content) + static_cast<int>(has_digest) > 1)
        return failf(ErrorKind::ParseError, "Step '{}' may only have one of source, content, digest", spec.name);

    if (auto kind = step.find("kind"); kind != step.end()) {
        auto parsed = parse_node_kind(kind->get<std::string>());
        if (!parsed)
            return std::unexpected(parsed.error());
        spec.kind = *parsed;
    } else {
        spec.kind = has_source || has_content || has_digest ? NodeKind::Source : NodeKind::Build;
    }

    spec.instruction = step.value("instruction", std::string{});
    for (const auto &input : step.value("inputs", nlohmann::json::array())) {
        std::string name = input.get<std::string>();
        auto id = graph.find(name);
        if (!id)
            return failf(ErrorKind::UnknownInput, "Step '{}' refers to unknown or later step '{}'", spec.name, name);
        spec.inputs.push_back(*id);
    }

    if (has_source) {
        spec.source_path = root / step.at("source").get<std::string>();
        std::error_code ec;
        auto ignore = fs::is_directory(spec.source_path, ec) ? IgnoreRules::load_for(spec.source_path) : IgnoreRules{};
        auto digest = fingerprint(spec.source_path, ignore, pool);
        if (!digest)
            return std::unexpected(digest.error());
        spec.context_fingerprint = *digest;
    } else if (has_content) {
        spec.content = step.at("content").get<std::string>();
        spec.context_fingerprint = fingerprint(std::string_view(*spec.content));
    } else if (has_digest) {
        auto digest = Digest::from_hex(step.at("digest").get<std::string>());
        if (!digest)
            return std::unexpected(digest.error());
        spec.context_fingerprint = *digest;
    }

    if (spec.kind != NodeKind::Source && spec.instruction.empty())
        return failf(ErrorKind::ParseError, "Step '{}' needs an instruction", spec.name);
    return spec;
}

} // namespace

Result<LoadedBuild> parse_build_description(const nlohmann::json &doc, const fs::path &root, WorkerPool *pool) {
    try {
        int version = doc.value("version", 0);
        if (version != build_file_version)
            return failf(ErrorKind::ParseError, "Unsupported build file version {}", version);

        Environment env;
        for (const auto &[key, value] : doc.value("env", nlohmann::json::object()).items())
            env.vars[key] = value.get<std::string>();
        if (doc.contains("platform"))
            env.platform = doc.at("platform").get<std::string>();

        LoadedBuild loaded{BuildGraph(env.fingerprint()), env, root};
        std::unordered_set<std::string> names;
        for (const auto &step : doc.at("steps")) {
            auto spec = parse_step(step, loaded.graph, root, pool);
            if (!spec)
                return std::unexpected(spec.error());
            if (!names.insert(spec->name).second)
                return failf(ErrorKind::ParseError, "Duplicate step name '{}'", spec->name);

            auto id = loaded.graph.add_node(std::move(*spec));
            if (!id)
                return std::unexpected(id.error());
        }
        log::debug("loaded {} steps", loaded.graph.size());
        return loaded;
    } catch (const nlohmann::json::exception &err) {
        return failf(ErrorKind::ParseError, "Malformed build description: {}", err.what());
    }
}

Result<LoadedBuild> load_build_file(const fs::path &path, WorkerPool *pool) {
    std::ifstream in(path);
    if (!in)
        return failf(ErrorKind::FilesystemError, "Failed to open build file: {}", path.string());

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception &err) {
        return failf(ErrorKind::ParseError, "{}: {}", path.string(), err.what());
    }

    fs::path root = path.has_parent_path() ? path.parent_path() : fs::current_path();
    return parse_build_description(doc, root, pool);
}

} // namespace memobuild
