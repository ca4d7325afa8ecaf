// Ratecord - rate limit aware Discord REST client for C++11 using boost libraries.
// Copyright © 2017 Maks Mazurov (fox.cpp) <foxcpp@yandex.ru>
// 
// Permission is hereby granted, free of charge, to any person obtaining
// a copy of this software and associated documentation files (the "Software"),
// to deal in the Software without restriction, including without limitation
// the rights to use, copy, modify, merge, publish, distribute, sublicense,
// and/or sell copies of the Software, and to permit persons to whom the
// Software is furnished to do so, subject to the following conditions:
// 
// The above copyright notice and this permission notice shall be included
// in all copies or substantial portions of the Software.
// 
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
// EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES
// OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.
// IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM,
// DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT,
// TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE
// OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.


#include <ratecord/route_key.hpp>

#include <ratecord/exceptions.hpp>
#include <ratecord/internal/utils.hpp>

namespace Ratecord {

static const std::string minorPlaceholder = ":id";

namespace {
    std::vector<std::string> pathSegments(const std::string& path) {
        std::string pathOnly = path.substr(0, path.find('?'));

        std::vector<std::string> result;
        for (auto& segment : Utils::split(pathOnly, '/')) {
            if (!segment.empty()) result.push_back(std::move(segment));
        }
        return result;
    }

    bool isParameter(const std::string& segment) {
        return segment.size() > 2 && segment.front() == '{' && segment.back() == '}';
    }

    std::string parameterName(const std::string& segment) {
        return segment.substr(1, segment.size() - 2);
    }
}

MajorParameterTable MajorParameterTable::defaults() {
    MajorParameterTable table;
    table.version = "discord-v10-2022.1";

    // Webhook token authorizes request, it must not end up in bucket keys.
    table.templates.push_back({ "/webhooks/{webhook_id}/{webhook_token}",
                                { "webhook_id" }, boost::none, boost::none });
    table.templates.push_back({ "/webhooks/{webhook_id}/{webhook_token}/messages/{message_id}",
                                { "webhook_id" }, boost::none, boost::none });
    table.templates.push_back({ "/interactions/{interaction_id}/{interaction_token}/callback",
                                { "interaction_id" }, boost::none, boost::none });

    // Adding and removing reactions share one bucket.
    for (const char* method : { "PUT", "DELETE" }) {
        table.templates.push_back({ "/channels/{channel_id}/messages/{message_id}/reactions/{emoji}/@me",
                                    { "channel_id" }, std::string(method), std::string("MODIFY") });
    }
    table.templates.push_back({ "/channels/{channel_id}/messages/{message_id}/reactions/{emoji}/{user_id}",
                                { "channel_id" }, std::string("DELETE"), std::string("MODIFY") });

    table.majorCollections     = { "channels", "guilds", "webhooks" };
    table.minorNameCollections = { "reactions" };

    return table;
}

RouteKeyResolver::RouteKeyResolver(MajorParameterTable table)
    : routeTable(std::move(table)) {

    for (const auto& routeTemplate : routeTable.templates) {
        if (routeTemplate.pattern.empty() || routeTemplate.pattern.front() != '/') {
            throw InvalidParameter("routes", std::string("template must start with '/': ") + routeTemplate.pattern);
        }
        templateSegments.push_back(pathSegments(routeTemplate.pattern));
    }
}

ResolvedRoute RouteKeyResolver::resolve(const std::string& method, const std::string& path) const {
    std::vector<std::string> segments = pathSegments(path);
    ResolvedRoute result;

    for (std::size_t i = 0; i < routeTable.templates.size(); ++i) {
        if (matchTemplate(routeTable.templates[i], templateSegments[i], method, segments, result)) {
            return result;
        }
    }

    applyCollectionRules(method, segments, result);
    return result;
}

bool RouteKeyResolver::matchTemplate(const RouteTemplate& routeTemplate,
                                     const std::vector<std::string>& pattern,
                                     const std::string& method,
                                     const std::vector<std::string>& segments,
                                     ResolvedRoute& result) const {

    if (routeTemplate.method && *routeTemplate.method != method) return false;
    if (pattern.size() != segments.size()) return false;

    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (!isParameter(pattern[i]) && pattern[i] != segments[i]) return false;
    }

    std::string key = routeTemplate.methodAlias ? *routeTemplate.methodAlias : method;
    key += ' ';
    std::vector<std::string> majorParameters;
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        key += '/';
        if (!isParameter(pattern[i])) {
            key += pattern[i];
        } else if (routeTemplate.majorParameters.count(parameterName(pattern[i]))) {
            key += segments[i];
            majorParameters.push_back(segments[i]);
        } else {
            key += pattern[i];
        }
    }
    if (pattern.empty()) key += '/';

    result.key = std::move(key);
    result.majorParameters = std::move(majorParameters);
    return true;
}

void RouteKeyResolver::applyCollectionRules(const std::string& method,
                                            const std::vector<std::string>& segments,
                                            ResolvedRoute& result) const {
    result.key = method + ' ';
    result.majorParameters.clear();

    for (std::size_t i = 0; i < segments.size(); ++i) {
        const std::string* collection = i != 0 ? &segments[i - 1] : nullptr;

        result.key += '/';
        if (collection && routeTable.minorNameCollections.count(*collection)) {
            result.key += minorPlaceholder;
        } else if (Utils::isNumber(segments[i])) {
            if (collection && routeTable.majorCollections.count(*collection)) {
                result.key += segments[i];
                result.majorParameters.push_back(segments[i]);
            } else {
                result.key += minorPlaceholder;
            }
        } else {
            result.key += segments[i];
        }
    }
    if (segments.empty()) result.key += '/';
}

} // namespace Ratecord
