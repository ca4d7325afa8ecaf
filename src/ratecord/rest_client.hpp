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


#ifndef RATECORD_REST_CLIENT_HPP
#define RATECORD_REST_CLIENT_HPP

#include <memory>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <nlohmann/json.hpp>
#include <ratecord/bucket_store.hpp>
#include <ratecord/dispatcher.hpp>
#include <ratecord/options.hpp>
#include <ratecord/transport.hpp>
#include <ratecord/types/file.hpp>
#include <ratecord/types/snowflake.hpp>

/**
 * \file rest_client.hpp
 *
 *  Defines \ref Ratecord::RestClient class.
 */

namespace Ratecord {

    /**
     * Discord REST API client.
     *
     * Methods only validate arguments, build path and body and pass them to
     * \ref Dispatcher, so all of them are safe to call from multiple threads
     * and respect ratelimits. Every method may throw exceptions listed in
     * \ref Dispatcher::request, only additional ones are documented.
     */
    class RestClient {
    public:
        /**
         * Construct client talking to discord.com over HTTPS. Does nothing
         * network-related.
         *
         * \param token  bot token, "Bot " prefix is added if token has neither
         *               "Bot " nor "Bearer " prefix.
         *
         * \throws InvalidParameter if token is empty.
         */
        explicit RestClient(const std::string& token, DispatcherOptions options = defaultOptions());

        /**
         * Construct client using custom transport.
         */
        RestClient(const std::string& token, std::unique_ptr<Transport> transport,
                   DispatcherOptions options = defaultOptions());

        RestClient(const RestClient&) = delete;
        RestClient& operator=(const RestClient&) = delete;

        /**
         * Dispatcher options with Discord's 50 requests per second global limit.
         */
        static DispatcherOptions defaultOptions();

        /**
         * Add "Bot " prefix if needed.
         *
         * \throws InvalidParameter if token is empty.
         */
        static std::string normalizeToken(const std::string& token);

        Dispatcher& dispatcher() { return *requestDispatcher; }

        /**
         * Returns gateway URL.
         */
        std::string getGatewayUrl();

        /**
         * Returns gateway URL together with recommended shards count
         * and session start limits.
         */
        nlohmann::json getGatewayBot();

        /// \defgroup REST_channels Channels
        /// @{

        nlohmann::json getChannel(Snowflake channelId);

        /// @}

        /**
         * \defgroup REST_messages Messages operations
         *
         * @{
         */

        /**
         * Tag types for \ref getMessages.
         */

        struct After { Snowflake id; };
        struct Before { Snowflake id; };
        struct Around { Snowflake id; };

        /**
         * Get latest messages in channel.
         *
         * \throws InvalidParameter if limit is out of range (1-100).
         */
        nlohmann::json getMessages(Snowflake channelId, boost::optional<unsigned> limit = boost::none);

        /**
         * Get messages after specified id.
         *
         * \throws InvalidParameter if limit is out of range (1-100).
         */
        nlohmann::json getMessages(Snowflake channelId, After afterId, boost::optional<unsigned> limit = boost::none);

        /**
         * Get messages before specified id.
         */
        nlohmann::json getMessages(Snowflake channelId, Before beforeId, boost::optional<unsigned> limit = boost::none);

        /**
         * Get messages around specified id.
         */
        nlohmann::json getMessages(Snowflake channelId, Around aroundId, boost::optional<unsigned> limit = boost::none);

        nlohmann::json getMessage(Snowflake channelId, Snowflake messageId);

        /**
         * Post message to channel. Message is JSON object as described in
         * Discord documentation (content, embeds, allowed_mentions, ...).
         * Files are uploaded as attachments, message object is sent as
         * payload_json in this case.
         *
         * \throws InvalidParameter if content is longer than 2000 characters
         *         or message has neither content, embeds nor files.
         */
        nlohmann::json createMessage(Snowflake channelId, const nlohmann::json& message,
                                     const std::vector<File>& files = {});

        /**
         * Shortcut for \ref createMessage with text content only.
         */
        nlohmann::json sendTextMessage(Snowflake channelId, const std::string& text, bool tts = false);

        /**
         * \throws InvalidParameter if content is longer than 2000 characters.
         */
        nlohmann::json editMessage(Snowflake channelId, Snowflake messageId, const nlohmann::json& changes);

        void deleteMessage(Snowflake channelId, Snowflake messageId,
                           const boost::optional<std::string>& reason = boost::none);

        /**
         * Delete multiple messages in a single request.
         *
         * \warning Discord refuses to delete messages older than 2 weeks.
         *
         * \throws InvalidParameter if count of messages is not in range 2-100.
         */
        void deleteMessages(Snowflake channelId, const std::vector<Snowflake>& messageIds,
                            const boost::optional<std::string>& reason = boost::none);

        /// @}

        /// \defgroup REST_reactions Reactions
        /// @{

        /**
         * React to message. Emoji is either unicode emoji or "name:id" for
         * custom emoji.
         */
        void addReaction(Snowflake channelId, Snowflake messageId, const std::string& emoji);

        void removeOwnReaction(Snowflake channelId, Snowflake messageId, const std::string& emoji);

        /// @}

        /// \defgroup REST_emojis Guild emojis
        /// @{

        nlohmann::json getGuildEmojis(Snowflake guildId);
        nlohmann::json getGuildEmoji(Snowflake guildId, Snowflake emojiId);

        /**
         * Create emoji from image (PNG, JPEG or GIF, up to 256 KiB).
         *
         * \throws InvalidParameter if name is shorter than 2 characters or
         *         image format is not supported.
         */
        nlohmann::json createGuildEmoji(Snowflake guildId, const std::string& name,
                                        const std::vector<uint8_t>& image,
                                        const std::vector<Snowflake>& roles = {},
                                        const boost::optional<std::string>& reason = boost::none);

        nlohmann::json modifyGuildEmoji(Snowflake guildId, Snowflake emojiId,
                                        const boost::optional<std::string>& name,
                                        const boost::optional<std::vector<Snowflake> >& roles = boost::none,
                                        const boost::optional<std::string>& reason = boost::none);

        void deleteGuildEmoji(Snowflake guildId, Snowflake emojiId,
                              const boost::optional<std::string>& reason = boost::none);

        /// @}

        /// \defgroup REST_stickers Guild stickers
        /// @{

        /**
         * Upload sticker (PNG, APNG, GIF or Lottie JSON).
         *
         * \param tags  autocomplete suggestion tags, comma separated.
         *
         * \throws InvalidParameter if name is not 2-30 characters long.
         */
        nlohmann::json createGuildSticker(Snowflake guildId, const std::string& name,
                                          const std::string& description, const std::string& tags,
                                          const File& file,
                                          const boost::optional<std::string>& reason = boost::none);

        void deleteGuildSticker(Snowflake guildId, Snowflake stickerId,
                                const boost::optional<std::string>& reason = boost::none);

        /// @}

        /// \defgroup REST_webhooks Webhooks
        /// @{

        /**
         * Execute webhook. Returns created message if wait is true, null otherwise.
         *
         * \throws InvalidParameter if token is empty.
         */
        nlohmann::json executeWebhook(Snowflake webhookId, const std::string& token,
                                      const nlohmann::json& message,
                                      const std::vector<File>& files = {},
                                      boost::optional<bool> wait = boost::none,
                                      boost::optional<Snowflake> threadId = boost::none);

        /// @}

        /**
         * Get audit log of guild.
         *
         * \throws InvalidParameter if limit is out of range (1-100).
         */
        nlohmann::json getGuildAuditLog(Snowflake guildId,
                                        boost::optional<Snowflake> userId = boost::none,
                                        boost::optional<unsigned> actionType = boost::none,
                                        boost::optional<Snowflake> before = boost::none,
                                        boost::optional<unsigned> limit = boost::none);

    private:
        nlohmann::json getMessages(Snowflake channelId, const char* anchorName,
                                   boost::optional<Snowflake> anchor, boost::optional<unsigned> limit);

        std::unique_ptr<Transport> transport;
        BucketStore store;
        std::unique_ptr<Dispatcher> requestDispatcher;
    };
} // namespace Ratecord

#endif // RATECORD_REST_CLIENT_HPP
