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


#ifndef RATECORD_ENDPOINTS_HPP
#define RATECORD_ENDPOINTS_HPP

#include <string>
#include <ratecord/types/snowflake.hpp>

/**
 * \file endpoints.hpp
 *
 * Path builders for Discord REST API endpoints, relative to API base path.
 */

namespace Ratecord { namespace Endpoints {
    inline std::string gateway()    { return "/gateway"; }
    inline std::string gatewayBot() { return "/gateway/bot"; }

    inline std::string channel(Snowflake channelId) {
        return std::string("/channels/") + channelId.str();
    }

    inline std::string channelMessages(Snowflake channelId) {
        return channel(channelId) + "/messages";
    }

    inline std::string channelMessage(Snowflake channelId, Snowflake messageId) {
        return channelMessages(channelId) + "/" + messageId.str();
    }

    inline std::string channelBulkDelete(Snowflake channelId) {
        return channelMessages(channelId) + "/bulk-delete";
    }

    /// Emoji should be already percent-encoded.
    inline std::string channelMessageReaction(Snowflake channelId, Snowflake messageId, const std::string& emoji) {
        return channelMessage(channelId, messageId) + "/reactions/" + emoji;
    }

    inline std::string channelMessageReactionUser(Snowflake channelId, Snowflake messageId,
                                                  const std::string& emoji, const std::string& user) {
        return channelMessageReaction(channelId, messageId, emoji) + "/" + user;
    }

    inline std::string guild(Snowflake guildId) {
        return std::string("/guilds/") + guildId.str();
    }

    inline std::string guildAuditLogs(Snowflake guildId) {
        return guild(guildId) + "/audit-logs";
    }

    inline std::string guildEmojis(Snowflake guildId) {
        return guild(guildId) + "/emojis";
    }

    inline std::string guildEmoji(Snowflake guildId, Snowflake emojiId) {
        return guildEmojis(guildId) + "/" + emojiId.str();
    }

    inline std::string guildStickers(Snowflake guildId) {
        return guild(guildId) + "/stickers";
    }

    inline std::string guildSticker(Snowflake guildId, Snowflake stickerId) {
        return guildStickers(guildId) + "/" + stickerId.str();
    }

    inline std::string webhook(Snowflake webhookId) {
        return std::string("/webhooks/") + webhookId.str();
    }

    inline std::string webhookToken(Snowflake webhookId, const std::string& token) {
        return webhook(webhookId) + "/" + token;
    }
}} // namespace Ratecord::Endpoints

#endif // RATECORD_ENDPOINTS_HPP
