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


#ifndef RATECORD_ROUTE_KEY_HPP
#define RATECORD_ROUTE_KEY_HPP

#include <set>
#include <string>
#include <vector>
#include <boost/optional.hpp>

namespace Ratecord {
    /**
     * Route pattern with named parameters, for example
     * `/webhooks/{webhook_id}/{webhook_token}`.
     */
    struct RouteTemplate {
        std::string pattern;

        /// Parameter names whose values are kept in bucket key.
        std::set<std::string> majorParameters;

        /// If set, template applies only to requests with this method.
        boost::optional<std::string> method;

        /// If set, used instead of request method in bucket key so
        /// different methods share one bucket.
        boost::optional<std::string> methodAlias;
    };

    /**
     * Declarative description of how Discord groups routes into buckets.
     *
     * Templates are tried in order, first match wins. Paths matched by no
     * template use collection rules: numeric id after collection listed in
     * majorCollections is kept, any other numeric segment is replaced by
     * placeholder, as well as any segment following collection listed in
     * minorNameCollections (reactions are keyed by emoji, not by id).
     *
     * Bucketing rules are not fully documented by Discord and change over
     * time, so table is versioned and can be replaced by user.
     */
    struct MajorParameterTable {
        std::string version;

        std::vector<RouteTemplate> templates;
        std::set<std::string> majorCollections;
        std::set<std::string> minorNameCollections;

        /**
         * Table matching Discord API v10 behavior known at time of writing.
         */
        static MajorParameterTable defaults();
    };

    struct ResolvedRoute {
        /// "METHOD /templated/path", e.g. "POST /channels/123/messages".
        std::string key;

        /// Values of major parameters in path order.
        std::vector<std::string> majorParameters;
    };

    class RouteKeyResolver {
    public:
        explicit RouteKeyResolver(MajorParameterTable table = MajorParameterTable::defaults());

        /**
         * Compute bucket key for concrete path. Query string is ignored.
         */
        ResolvedRoute resolve(const std::string& method, const std::string& path) const;

        const MajorParameterTable& table() const { return routeTable; }

    private:
        bool matchTemplate(const RouteTemplate& routeTemplate,
                           const std::vector<std::string>& templateSegments,
                           const std::string& method,
                           const std::vector<std::string>& segments,
                           ResolvedRoute& result) const;

        void applyCollectionRules(const std::string& method,
                                  const std::vector<std::string>& segments,
                                  ResolvedRoute& result) const;

        MajorParameterTable routeTable;
        std::vector<std::vector<std::string> > templateSegments;
    };
} // namespace Ratecord

#endif // RATECORD_ROUTE_KEY_HPP
