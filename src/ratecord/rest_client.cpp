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


#include <ratecord/rest_client.hpp>

#include <ratecord/config.hpp>
#include <ratecord/endpoints.hpp>
#include <ratecord/exceptions.hpp>
#include <ratecord/https_transport.hpp>
#include <ratecord/internal/utils.hpp>

namespace Ratecord {

namespace {
    RequestOptions withReason(const boost::optional<std::string>& reason) {
        RequestOptions options;
        options.reason = reason;
        return options;
    }

    boost::optional<std::string> optionalString(const boost::optional<Snowflake>& value) {
        return value ? boost::optional<std::string>(value->str()) : boost::none;
    }

    boost::optional<std::string> optionalString(const boost::optional<unsigned>& value) {
        return value ? boost::optional<std::string>(std::to_string(*value)) : boost::none;
    }

    void checkLimit(const boost::optional<unsigned>& limit) {
        if (limit && (*limit == 0 || *limit > 100)) {
            throw InvalidParameter("limit", "limit out of range (should be 1-100).");
        }
    }

    void checkContent(const nlohmann::json& message) {
        if (!message.is_object()) {
            throw InvalidParameter("message", "should be an object.");
        }
        auto contentIt = message.find("content");
        if (contentIt != message.end() && contentIt->is_string() &&
            contentIt->get<std::string>().size() > 2000) {

            throw InvalidParameter("content", "content out of range (should be 0-2000).");
        }
    }
}

RestClient::RestClient(const std::string& token, DispatcherOptions options)
    : RestClient(token, std::unique_ptr<Transport>(new HTTPSTransport("discord.com")), std::move(options)) {}

RestClient::RestClient(const std::string& token, std::unique_ptr<Transport> transport, DispatcherOptions options)
    : transport(std::move(transport)) {

    options.headers["Authorization"] = normalizeToken(token);
    options.headers["User-Agent"]    = std::string("DiscordBot (") + RATECORD_GITHUB + ", " + RATECORD_VERSION + ")";

    requestDispatcher.reset(new Dispatcher(*this->transport, store, std::move(options)));
}

DispatcherOptions RestClient::defaultOptions() {
    DispatcherOptions options;
    options.globalRequestsPerSecond = 50;
    return options;
}

std::string RestClient::normalizeToken(const std::string& token) {
    if (token.empty()) throw InvalidParameter("token", "token is empty.");

    if (token.compare(0, 4, "Bot ") == 0 || token.compare(0, 7, "Bearer ") == 0) return token;
    return std::string("Bot ") + token;
}

std::string RestClient::getGatewayUrl() {
    return requestDispatcher->request("GET", Endpoints::gateway())["url"].get<std::string>();
}

nlohmann::json RestClient::getGatewayBot() {
    return requestDispatcher->request("GET", Endpoints::gatewayBot());
}

nlohmann::json RestClient::getChannel(Snowflake channelId) {
    return requestDispatcher->request("GET", Endpoints::channel(channelId));
}

nlohmann::json RestClient::getMessages(Snowflake channelId, const char* anchorName,
                                       boost::optional<Snowflake> anchor, boost::optional<unsigned> limit) {
    checkLimit(limit);

    RequestOptions options;
    options.query = {
        { anchorName, optionalString(anchor) },
        { "limit",    optionalString(limit)  }
    };
    return requestDispatcher->request("GET", Endpoints::channelMessages(channelId), RequestBody::none(), options);
}

nlohmann::json RestClient::getMessages(Snowflake channelId, boost::optional<unsigned> limit) {
    return getMessages(channelId, "after", boost::none, limit);
}

nlohmann::json RestClient::getMessages(Snowflake channelId, RestClient::After afterId, boost::optional<unsigned> limit) {
    return getMessages(channelId, "after", afterId.id, limit);
}

nlohmann::json RestClient::getMessages(Snowflake channelId, RestClient::Before beforeId, boost::optional<unsigned> limit) {
    return getMessages(channelId, "before", beforeId.id, limit);
}

nlohmann::json RestClient::getMessages(Snowflake channelId, RestClient::Around aroundId, boost::optional<unsigned> limit) {
    return getMessages(channelId, "around", aroundId.id, limit);
}

nlohmann::json RestClient::getMessage(Snowflake channelId, Snowflake messageId) {
    return requestDispatcher->request("GET", Endpoints::channelMessage(channelId, messageId));
}

nlohmann::json RestClient::createMessage(Snowflake channelId, const nlohmann::json& message,
                                         const std::vector<File>& files) {
    checkContent(message);
    if (files.empty() && !message.count("content") && !message.count("embeds") && !message.count("sticker_ids")) {
        throw InvalidParameter("message", "message should have content, embeds, stickers or files.");
    }

    RequestBody body = files.empty() ? RequestBody::structured(message)
                                     : RequestBody::multipart(message, files);
    return requestDispatcher->request("POST", Endpoints::channelMessages(channelId), body);
}

nlohmann::json RestClient::sendTextMessage(Snowflake channelId, const std::string& text, bool tts) {
    return createMessage(channelId, {
        { "content", text },
        { "tts",     tts  }
    });
}

nlohmann::json RestClient::editMessage(Snowflake channelId, Snowflake messageId, const nlohmann::json& changes) {
    checkContent(changes);
    return requestDispatcher->request("PATCH", Endpoints::channelMessage(channelId, messageId),
                                      RequestBody::structured(changes));
}

void RestClient::deleteMessage(Snowflake channelId, Snowflake messageId, const boost::optional<std::string>& reason) {
    requestDispatcher->request("DELETE", Endpoints::channelMessage(channelId, messageId),
                               RequestBody::none(), withReason(reason));
}

void RestClient::deleteMessages(Snowflake channelId, const std::vector<Snowflake>& messageIds,
                                const boost::optional<std::string>& reason) {
    if (messageIds.size() < 2 || messageIds.size() > 100) {
        throw InvalidParameter("messageIds", "count of messages out of range (should be 2-100).");
    }

    requestDispatcher->request("POST", Endpoints::channelBulkDelete(channelId),
                               RequestBody::structured({{ "messages", messageIds }}), withReason(reason));
}

void RestClient::addReaction(Snowflake channelId, Snowflake messageId, const std::string& emoji) {
    if (emoji.empty()) throw InvalidParameter("emoji", "emoji is empty.");

    requestDispatcher->request("PUT", Endpoints::channelMessageReactionUser(channelId, messageId,
                                                                            Utils::urlEncode(emoji), "@me"));
}

void RestClient::removeOwnReaction(Snowflake channelId, Snowflake messageId, const std::string& emoji) {
    if (emoji.empty()) throw InvalidParameter("emoji", "emoji is empty.");

    requestDispatcher->request("DELETE", Endpoints::channelMessageReactionUser(channelId, messageId,
                                                                               Utils::urlEncode(emoji), "@me"));
}

nlohmann::json RestClient::getGuildEmojis(Snowflake guildId) {
    return requestDispatcher->request("GET", Endpoints::guildEmojis(guildId));
}

nlohmann::json RestClient::getGuildEmoji(Snowflake guildId, Snowflake emojiId) {
    return requestDispatcher->request("GET", Endpoints::guildEmoji(guildId, emojiId));
}

nlohmann::json RestClient::createGuildEmoji(Snowflake guildId, const std::string& name,
                                            const std::vector<uint8_t>& image,
                                            const std::vector<Snowflake>& roles,
                                            const boost::optional<std::string>& reason) {
    if (name.size() < 2 || name.size() > 32) {
        throw InvalidParameter("name", "name length out of range (should be 2-32).");
    }
    if (!Utils::Magic::isPng(image) && !Utils::Magic::isJfif(image) && !Utils::Magic::isGif(image)) {
        throw InvalidParameter("image", "unsupported image format (should be PNG, JPEG or GIF).");
    }

    nlohmann::json payload {
        { "name",  name                       },
        { "image", Utils::imageDataUri(image) },
        { "roles", roles                      }
    };
    return requestDispatcher->request("POST", Endpoints::guildEmojis(guildId),
                                      RequestBody::structured(payload), withReason(reason));
}

nlohmann::json RestClient::modifyGuildEmoji(Snowflake guildId, Snowflake emojiId,
                                            const boost::optional<std::string>& name,
                                            const boost::optional<std::vector<Snowflake> >& roles,
                                            const boost::optional<std::string>& reason) {
    nlohmann::json payload = nlohmann::json::object();
    if (name)  payload["name"]  = *name;
    if (roles) payload["roles"] = *roles;

    return requestDispatcher->request("PATCH", Endpoints::guildEmoji(guildId, emojiId),
                                      RequestBody::structured(payload), withReason(reason));
}

void RestClient::deleteGuildEmoji(Snowflake guildId, Snowflake emojiId, const boost::optional<std::string>& reason) {
    requestDispatcher->request("DELETE", Endpoints::guildEmoji(guildId, emojiId), RequestBody::none(), withReason(reason));
}

nlohmann::json RestClient::createGuildSticker(Snowflake guildId, const std::string& name,
                                              const std::string& description, const std::string& tags,
                                              const File& file,
                                              const boost::optional<std::string>& reason) {
    if (name.size() < 2 || name.size() > 30) {
        throw InvalidParameter("name", "name length out of range (should be 2-30).");
    }

    File stickerFile = file;
    stickerFile.fieldName = "file";

    nlohmann::json fields {
        { "name",        name        },
        { "description", description },
        { "tags",        tags        }
    };
    return requestDispatcher->request("POST", Endpoints::guildStickers(guildId),
                                      RequestBody::form(fields, { stickerFile }), withReason(reason));
}

void RestClient::deleteGuildSticker(Snowflake guildId, Snowflake stickerId, const boost::optional<std::string>& reason) {
    requestDispatcher->request("DELETE", Endpoints::guildSticker(guildId, stickerId), RequestBody::none(), withReason(reason));
}

nlohmann::json RestClient::executeWebhook(Snowflake webhookId, const std::string& token,
                                          const nlohmann::json& message,
                                          const std::vector<File>& files,
                                          boost::optional<bool> wait,
                                          boost::optional<Snowflake> threadId) {
    if (token.empty()) throw InvalidParameter("token", "webhook token is empty.");
    checkContent(message);

    RequestOptions options;
    options.query = {
        { "wait",      wait ? boost::optional<std::string>(*wait ? "true" : "false") : boost::none },
        { "thread_id", optionalString(threadId) }
    };

    RequestBody body = files.empty() ? RequestBody::structured(message)
                                     : RequestBody::multipart(message, files);
    return requestDispatcher->request("POST", Endpoints::webhookToken(webhookId, token), body, options);
}

nlohmann::json RestClient::getGuildAuditLog(Snowflake guildId,
                                            boost::optional<Snowflake> userId,
                                            boost::optional<unsigned> actionType,
                                            boost::optional<Snowflake> before,
                                            boost::optional<unsigned> limit) {
    checkLimit(limit);

    RequestOptions options;
    options.query = {
        { "user_id",     optionalString(userId)     },
        { "action_type", optionalString(actionType) },
        { "before",      optionalString(before)     },
        { "limit",       optionalString(limit)      }
    };
    return requestDispatcher->request("GET", Endpoints::guildAuditLogs(guildId), RequestBody::none(), options);
}

} // namespace Ratecord
