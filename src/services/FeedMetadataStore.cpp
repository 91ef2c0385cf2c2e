#include "services/FeedMetadataStore.hpp"
#include <json-glib/json-glib.h>
#include <glib.h>
#include <glib/gstdio.h>

namespace FeedLine {

JsonFeedMetadataStore::JsonFeedMetadataStore(std::string path) : path_(std::move(path)) {}

static std::string stringMember(JsonObject* obj, const char* name) {
    if (!json_object_has_member(obj, name)) return "";
    const char* value = json_object_get_string_member(obj, name);
    return value ? value : "";
}

std::vector<FeedSource> JsonFeedMetadataStore::readLocked() const {
    std::vector<FeedSource> sources;
    if (!g_file_test(path_.c_str(), G_FILE_TEST_EXISTS)) return sources;

    JsonParser* parser = json_parser_new();
    GError* error = nullptr;
    if (!json_parser_load_from_file(parser, path_.c_str(), &error)) {
        g_warning("failed to read feed sources %s: %s", path_.c_str(), error ? error->message : "unknown");
        if (error) g_error_free(error);
        g_object_unref(parser);
        return sources;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (root && JSON_NODE_HOLDS_ARRAY(root)) {
        JsonArray* arr = json_node_get_array(root);
        guint len = json_array_get_length(arr);
        for (guint i = 0; i < len; i++) {
            JsonNode* element = json_array_get_element(arr, i);
            if (!JSON_NODE_HOLDS_OBJECT(element)) continue;
            JsonObject* obj = json_node_get_object(element);
            FeedSource s;
            s.name = stringMember(obj, "name");
            s.url = stringMember(obj, "url");
            s.faviconUrl = stringMember(obj, "faviconUrl");
            if (!s.url.empty()) sources.push_back(s);
        }
    }
    g_object_unref(parser);
    return sources;
}

bool JsonFeedMetadataStore::writeLocked(const std::vector<FeedSource>& sources) const {
    gchar* dir = g_path_get_dirname(path_.c_str());
    g_mkdir_with_parents(dir, 0755);
    g_free(dir);

    JsonBuilder* builder = json_builder_new();
    json_builder_begin_array(builder);
    for (const auto& s : sources) {
        json_builder_begin_object(builder);
        json_builder_set_member_name(builder, "name");
        json_builder_add_string_value(builder, s.name.c_str());
        json_builder_set_member_name(builder, "url");
        json_builder_add_string_value(builder, s.url.c_str());
        json_builder_set_member_name(builder, "faviconUrl");
        json_builder_add_string_value(builder, s.faviconUrl.c_str());
        json_builder_end_object(builder);
    }
    json_builder_end_array(builder);

    JsonGenerator* gen = json_generator_new();
    json_generator_set_pretty(gen, TRUE);
    JsonNode* rootNode = json_builder_get_root(builder);
    json_generator_set_root(gen, rootNode);

    GError* error = nullptr;
    bool ok = json_generator_to_file(gen, path_.c_str(), &error);
    if (!ok) {
        g_warning("failed to write feed sources %s: %s", path_.c_str(), error ? error->message : "unknown");
    }
    if (error) g_error_free(error);

    json_node_unref(rootNode);
    g_object_unref(gen);
    g_object_unref(builder);
    return ok;
}

std::vector<FeedSource> JsonFeedMetadataStore::findAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    return readLocked();
}

bool JsonFeedMetadataStore::findByUrl(const std::string& url, FeedSource& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& s : readLocked()) {
        if (s.url == url) {
            out = s;
            return true;
        }
    }
    return false;
}

bool JsonFeedMetadataStore::updateFaviconUrl(const std::string& url, const std::string& faviconUrl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sources = readLocked();
    for (auto& s : sources) {
        if (s.url != url) continue;
        if (s.faviconUrl == faviconUrl) return true;
        s.faviconUrl = faviconUrl;
        return writeLocked(sources);
    }
    return false;
}

bool JsonFeedMetadataStore::add(const FeedSource& source) {
    if (source.url.empty()) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    auto sources = readLocked();
    for (auto& s : sources) {
        if (s.url == source.url) {
            s = source;
            return writeLocked(sources);
        }
    }
    sources.push_back(source);
    return writeLocked(sources);
}

}
