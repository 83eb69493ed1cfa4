#include "options.hpp"

#include <fstream>
#include <stdexcept>

namespace scan_notifier {

namespace {

std::shared_ptr<const PathPattern> compile(const std::string& expression) {
    if (expression.empty()) {
        return nullptr;
    }
    return std::make_shared<PathPattern>(expression);
}

}  // namespace

Options::Options() = default;

std::shared_ptr<Options> Options::create() {
    return std::make_shared<Options>();
}

std::shared_ptr<Options> Options::withPatterns(const std::string& exclude, const std::string& include) {
    auto options = create();
    options->setExcludePaths(exclude).setIncludePaths(include);
    return options;
}

std::shared_ptr<Options> Options::fromJson(const Json::Value& json) {
    auto options = create();
    if (!json.isObject()) {
        return options;
    }

    if (json.isMember("queue_size")) {
        options->setQueueSize(json["queue_size"].asUInt64());
    }
    if (json.isMember("max_workers")) {
        options->setMaxWorkers(json["max_workers"].asUInt());
    }
    if (json.isMember("scan_interval_ms")) {
        options->setScanInterval(std::chrono::milliseconds(json["scan_interval_ms"].asInt64()));
    }
    options->setExcludePaths(json.get("exclude_paths", "").asString());
    options->setIncludePaths(json.get("include_paths", "").asString());

    const Json::Value& ignore = json["ignore"];
    if (ignore.isObject()) {
        options->setIgnoreErrors(ignore.get("errors", options->ignoreErrors()).asBool())
            .setIgnoreNoChangeEvent(ignore.get("no_change", options->ignoreNoChange()).asBool())
            .setIgnoreDeleteEvent(ignore.get("delete", options->ignoreDelete()).asBool())
            .setIgnoreCreateEvent(ignore.get("create", options->ignoreCreate()).asBool())
            .setIgnoreModifyEvent(ignore.get("modify", options->ignoreModify()).asBool())
            .setIgnorePermEvent(ignore.get("permissions", options->ignorePerm()).asBool())
            .setIgnoreFileEvent(ignore.get("files", options->ignoreFile()).asBool())
            .setIgnoreFolderEvent(ignore.get("folders", options->ignoreFolder()).asBool())
            .setIgnoreSymlink(ignore.get("symlinks", options->ignoreSymlink()).asBool())
            .setIgnoreFolderContentEvent(ignore.get("folder_content", options->ignoreFolderContent()).asBool());
    }
    return options;
}

std::shared_ptr<Options> Options::loadFile(const std::filesystem::path& path) {
    std::ifstream inFile(path);
    if (!inFile) {
        throw std::runtime_error("Failed to open options file: " + path.string());
    }

    Json::CharReaderBuilder builder;
    Json::Value json;
    JSONCPP_STRING errs;
    if (!Json::parseFromStream(builder, inFile, &json, &errs)) {
        throw std::runtime_error("Failed to parse options file " + path.string() + ": " + errs);
    }
    return fromJson(json);
}

Json::Value Options::toJson() const {
    Json::Value json;
    json["queue_size"] = static_cast<Json::UInt64>(queueSize());
    json["max_workers"] = maxWorkers();
    json["scan_interval_ms"] = static_cast<Json::Int64>(scanInterval().count());

    auto exclude = excludePaths();
    json["exclude_paths"] = exclude ? exclude->source : "";
    auto include = includePaths();
    json["include_paths"] = include ? include->source : "";

    Json::Value& ignore = json["ignore"];
    ignore["errors"] = ignoreErrors();
    ignore["no_change"] = ignoreNoChange();
    ignore["delete"] = ignoreDelete();
    ignore["create"] = ignoreCreate();
    ignore["modify"] = ignoreModify();
    ignore["permissions"] = ignorePerm();
    ignore["files"] = ignoreFile();
    ignore["folders"] = ignoreFolder();
    ignore["symlinks"] = ignoreSymlink();
    ignore["folder_content"] = ignoreFolderContent();
    return json;
}

Options& Options::setQueueSize(std::size_t value) {
    if (value > 0) {
        m_queueSize.store(value);
    }
    return *this;
}

Options& Options::setMaxWorkers(std::uint32_t value) {
    if (value > 0) {
        m_maxWorkers.store(value);
    }
    return *this;
}

Options& Options::setScanInterval(std::chrono::milliseconds value) {
    m_scanIntervalMs.store(value.count());
    return *this;
}

Options& Options::setExcludePaths(const std::string& expression) {
    m_excludePaths.store(compile(expression));
    return *this;
}

Options& Options::setIncludePaths(const std::string& expression) {
    m_includePaths.store(compile(expression));
    return *this;
}

Options& Options::setIgnoreErrors(bool value) {
    m_ignoreErrors.store(value);
    return *this;
}

Options& Options::setIgnoreNoChangeEvent(bool value) {
    m_ignoreNoChange.store(value);
    return *this;
}

Options& Options::setIgnoreDeleteEvent(bool value) {
    m_ignoreDelete.store(value);
    return *this;
}

Options& Options::setIgnoreCreateEvent(bool value) {
    m_ignoreCreate.store(value);
    return *this;
}

Options& Options::setIgnoreModifyEvent(bool value) {
    m_ignoreModify.store(value);
    return *this;
}

Options& Options::setIgnorePermEvent(bool value) {
    m_ignorePerm.store(value);
    return *this;
}

Options& Options::setIgnoreFileEvent(bool value) {
    m_ignoreFile.store(value);
    return *this;
}

Options& Options::setIgnoreFolderEvent(bool value) {
    m_ignoreFolder.store(value);
    return *this;
}

Options& Options::setIgnoreSymlink(bool value) {
    m_ignoreSymlink.store(value);
    return *this;
}

Options& Options::setIgnoreFolderContentEvent(bool value) {
    m_ignoreFolderContent.store(value);
    return *this;
}

}  // namespace scan_notifier
