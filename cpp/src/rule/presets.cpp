// ==============================================================================
// presets.cpp - Встроенные пресеты фильтрации
// ==============================================================================
//
// Id правил пресета: "<preset>.<name>". При повторном применении пресета
// правила с тем же id заменяются, а не дублируются.
//
// ==============================================================================

#include <harvest/rule.hpp>

#include <initializer_list>

namespace harvest::rule {

namespace {

struct RuleSpec {
    const char* name;
    const char* pattern;
    FilterType type;
    const char* description;
};

Preset make_preset(const char* id, const char* name, const char* description,
                   std::initializer_list<RuleSpec> rules) {
    Preset preset;
    preset.id = id;
    preset.name = name;
    preset.description = description;
    for (const auto& spec : rules) {
        FilterRule r;
        r.id = std::string(id) + "." + spec.name;
        r.pattern = spec.pattern;
        r.type = spec.type;
        r.description = std::string(spec.description);
        preset.rules.push_back(std::move(r));
    }
    return preset;
}

std::vector<Preset> make_builtin_presets() {
    std::vector<Preset> presets;

    presets.push_back(make_preset(
        "static-files", "Static files", "Common static file extensions",
        {
            {"styles", R"(\.(css|less|scss|sass)(\?|$))", FilterType::Url, "Stylesheets"},
            {"scripts", R"(\.(js|jsx|ts|tsx|mjs)(\?|$))", FilterType::Url, "Scripts"},
            {"images", R"(\.(png|jpg|jpeg|gif|webp|svg|ico)(\?|$))", FilterType::Url, "Images"},
            {"fonts", R"(\.(woff|woff2|ttf|eot|otf)(\?|$))", FilterType::Url, "Fonts"},
            {"source-maps", R"(\.(map)(\?|$))", FilterType::Url, "Source maps"},
        }));

    presets.push_back(make_preset(
        "static-content", "Static content", "Static content by Content-Type",
        {
            {"css", "^text/css", FilterType::ContentType, "CSS"},
            {"javascript", "^application/javascript", FilterType::ContentType, "JavaScript"},
            {"text-javascript", "^text/javascript", FilterType::ContentType, "JavaScript text"},
            {"images", "^image/", FilterType::ContentType, "Images"},
            {"fonts", "^font/", FilterType::ContentType, "Fonts"},
            {"application-fonts", "^application/font", FilterType::ContentType, "Fonts"},
            {"html", "text/html", FilterType::ContentType, "HTML pages"},
        }));

    presets.push_back(make_preset(
        "cdn-hosts", "CDN hosts", "Well-known CDN domains",
        {
            {"generic", R"(cdn\.)", FilterType::Host, "Generic CDN domain"},
            {"cloudfront", R"(\.cloudfront\.net$)", FilterType::Host, "Amazon CloudFront"},
            {"akamai", R"(\.akamai\.net$)", FilterType::Host, "Akamai"},
            {"fastly", R"(\.fastly\.net$)", FilterType::Host, "Fastly"},
        }));

    presets.push_back(make_preset(
        "analytics", "Analytics", "Analytics and tracking services",
        {
            {"google-analytics", R"(google-analytics\.com)", FilterType::Host,
             "Google Analytics"},
            {"generic", R"(analytics\.)", FilterType::Host, "Generic analytics service"},
            {"tracking", R"(tracking\.)", FilterType::Host, "Generic tracking service"},
        }));

    presets.push_back(make_preset(
        "common-static", "Common static directories", "Common static asset directories",
        {
            {"static", "/static/", FilterType::Url, "static directory"},
            {"assets", "/assets/", FilterType::Url, "assets directory"},
            {"dist", "/dist/", FilterType::Url, "dist directory"},
            {"public", "/public/", FilterType::Url, "public directory"},
        }));

    presets.push_back(make_preset(
        "non-api-content", "Non-API content", "Content that is not an API payload",
        {
            {"html", "text/html", FilterType::ContentType, "HTML pages"},
            {"plain-text", "^text/plain", FilterType::ContentType, "Plain text"},
            {"form-data", "^multipart/form-data", FilterType::ContentType, "Form uploads"},
        }));

    presets.push_back(make_preset(
        "chrome-style", "Fetch/XHR only",
        "Keep only fetch/XHR traffic, like the browser developer tools filter",
        {
            {"media", R"(\.(mp3|mp4|avi|mov|wav|ogg|webm|flv|mkv)(\?|$))", FilterType::Url,
             "Audio and video"},
            {"documents", R"(\.(pdf|doc|docx|xls|xlsx|ppt|pptx|txt|log)(\?|$))",
             FilterType::Url, "Documents"},
            {"archives", R"(\.(zip|rar|7z|tar|gz|bz2)(\?|$))", FilterType::Url, "Archives"},
            {"other-static", R"(\.(ico|svg|xml|json|yaml|yml)(\?|$))", FilterType::Url,
             "Other static resources"},
            {"audio", "^audio/", FilterType::ContentType, "Audio"},
            {"video", "^video/", FilterType::ContentType, "Video"},
            {"pdf", "^application/pdf", FilterType::ContentType, "PDF documents"},
            {"text-xml", "^text/xml", FilterType::ContentType, "XML text"},
            {"application-xml", "^application/xml", FilterType::ContentType, "XML"},
            {"zip", "^application/zip", FilterType::ContentType, "ZIP archives"},
            {"text-javascript", "^text/javascript", FilterType::ContentType,
             "JavaScript text"},
            {"websocket", "^ws://", FilterType::Url, "WebSocket"},
            {"secure-websocket", "^wss://", FilterType::Url, "Secure WebSocket"},
        }));

    presets.push_back(make_preset(
        "common-noise", "Capture noise", "Noise dropped before building API definitions",
        {
            {"assets", R"(\.(jpg|jpeg|png|gif|ico|css|js|woff|woff2|ttf|svg)(\?|$))",
             FilterType::Url, "Images, fonts, styles and scripts"},
            {"media", R"(\.(mp4|webm|ogg|mp3|wav)(\?|$))", FilterType::Url, "Media"},
            {"documents", R"(\.(pdf|doc|docx|xls|xlsx)(\?|$))", FilterType::Url, "Documents"},
            {"favicon", R"(/favicon\.ico)", FilterType::Url, "Favicon"},
            {"socket-io", "/socket\\.io/", FilterType::Url, "socket.io transport"},
            {"websocket", "/websocket/", FilterType::Url, "WebSocket endpoints"},
        }));

    return presets;
}

}  // namespace

const std::vector<Preset>& builtin_presets() {
    static const std::vector<Preset> presets = make_builtin_presets();
    return presets;
}

}  // namespace harvest::rule
