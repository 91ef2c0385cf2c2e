#include "utils/Config.hpp"
#include <json-glib/json-glib.h>
#include <glib.h>
#include <glib/gstdio.h>

namespace FeedLine {

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

Config::Config() {
    load();
}

std::string Config::configDir() const {
    gchar* dir = g_build_filename(g_get_user_config_dir(), "feedline", nullptr);
    std::string result(dir);
    g_free(dir);
    return result;
}

std::string Config::getConfigPath() const {
    return configDir() + "/config.json";
}

std::string Config::localFeedListPath() const {
    return configDir() + "/local_feeds";
}

std::string Config::sourcesPath() const {
    return configDir() + "/sources.json";
}

static int intMember(JsonObject* obj, const char* name, int fallback) {
    if (!json_object_has_member(obj, name)) return fallback;
    JsonNode* node = json_object_get_member(obj, name);
    if (!JSON_NODE_HOLDS_VALUE(node)) return fallback;
    gint64 value = json_node_get_int(node);
    return value > 0 ? static_cast<int>(value) : fallback;
}

bool Config::readSettings(const std::string& path, PipelineSettings& out) {
    JsonParser* parser = json_parser_new();
    GError* error = nullptr;

    if (!json_parser_load_from_file(parser, path.c_str(), &error)) {
        g_debug("no usable config at %s: %s", path.c_str(), error ? error->message : "unknown");
        if (error) g_error_free(error);
        g_object_unref(parser);
        return false;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        g_warning("config %s is not a JSON object, using defaults", path.c_str());
        g_object_unref(parser);
        return false;
    }

    JsonObject* obj = json_node_get_object(root);
    PipelineSettings s;
    s.maxConcurrentFetches = intMember(obj, "maxConcurrentFetches", s.maxConcurrentFetches);
    s.workerThreads = intMember(obj, "workerThreads", s.workerThreads);
    s.retryDelayMinMs = intMember(obj, "retryDelayMinMs", s.retryDelayMinMs);
    s.retryDelayMaxMs = intMember(obj, "retryDelayMaxMs", s.retryDelayMaxMs);
    s.localNewsItemCap = intMember(obj, "localNewsItemCap", s.localNewsItemCap);
    s.maxEnrichmentUpgrades = intMember(obj, "maxEnrichmentUpgrades", s.maxEnrichmentUpgrades);
    s.batchSize = intMember(obj, "batchSize", s.batchSize);
    s.batchIntervalMs = intMember(obj, "batchIntervalMs", s.batchIntervalMs);
    s.safetyTimeoutMs = intMember(obj, "safetyTimeoutMs", s.safetyTimeoutMs);
    s.requestTimeoutSeconds = intMember(obj, "requestTimeoutSeconds", s.requestTimeoutSeconds);
    if (json_object_has_member(obj, "userAgent")) {
        const char* ua = json_object_get_string_member(obj, "userAgent");
        if (ua && *ua) s.userAgent = ua;
    }
    if (json_object_has_member(obj, "enrichMissingThumbnails")) {
        s.enrichMissingThumbnails = json_object_get_boolean_member(obj, "enrichMissingThumbnails");
    }
    if (s.retryDelayMaxMs < s.retryDelayMinMs) s.retryDelayMaxMs = s.retryDelayMinMs;

    out = s;
    g_object_unref(parser);
    return true;
}

void Config::load() {
    g_mkdir_with_parents(configDir().c_str(), 0755);
    std::string path = getConfigPath();
    if (!readSettings(path, settings_)) {
        settings_ = PipelineSettings();
        // Keep a broken file around for the user to fix
        if (!g_file_test(path.c_str(), G_FILE_TEST_EXISTS)) save();
    }
}

bool Config::writeSettings(const std::string& path, const PipelineSettings& settings) {
    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);

    const std::pair<const char*, int> ints[] = {
        {"maxConcurrentFetches", settings.maxConcurrentFetches},
        {"workerThreads", settings.workerThreads},
        {"retryDelayMinMs", settings.retryDelayMinMs},
        {"retryDelayMaxMs", settings.retryDelayMaxMs},
        {"localNewsItemCap", settings.localNewsItemCap},
        {"maxEnrichmentUpgrades", settings.maxEnrichmentUpgrades},
        {"batchSize", settings.batchSize},
        {"batchIntervalMs", settings.batchIntervalMs},
        {"safetyTimeoutMs", settings.safetyTimeoutMs},
        {"requestTimeoutSeconds", settings.requestTimeoutSeconds},
    };
    for (const auto& entry : ints) {
        json_builder_set_member_name(builder, entry.first);
        json_builder_add_int_value(builder, entry.second);
    }
    json_builder_set_member_name(builder, "userAgent");
    json_builder_add_string_value(builder, settings.userAgent.c_str());
    json_builder_set_member_name(builder, "enrichMissingThumbnails");
    json_builder_add_boolean_value(builder, settings.enrichMissingThumbnails);

    json_builder_end_object(builder);

    JsonGenerator* gen = json_generator_new();
    json_generator_set_pretty(gen, TRUE);
    JsonNode* rootNode = json_builder_get_root(builder);
    json_generator_set_root(gen, rootNode);

    GError* error = nullptr;
    bool ok = json_generator_to_file(gen, path.c_str(), &error);
    if (!ok) {
        g_warning("failed to write config %s: %s", path.c_str(), error ? error->message : "unknown");
    }
    if (error) g_error_free(error);

    json_node_unref(rootNode);
    g_object_unref(gen);
    g_object_unref(builder);
    return ok;
}

void Config::save() {
    writeSettings(getConfigPath(), settings_);
}

void Config::applyEnvironment(PipelineSettings& settings) {
    settings.debugLogging = g_getenv("FEEDLINE_DEBUG") != nullptr;
    const char* cdn = g_getenv("FEEDLINE_ENABLE_CDN_EXTRACT");
    settings.cdnExtractEnabled = !(cdn && g_strcmp0(cdn, "0") == 0);
}

PipelineSettings Config::pipelineSettings() const {
    PipelineSettings s = settings_;
    applyEnvironment(s);
    return s;
}

}
