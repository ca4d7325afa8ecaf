#include <cstdlib>
#include <future>
#include <iostream>
#include <vector>
#include <ratecord/endpoints.hpp>
#include <ratecord/exceptions.hpp>
#include <ratecord/rest_client.hpp>

int main(int argc, char** argv) {
    const char* botToken = std::getenv("BOT_TOKEN");
    if (!botToken) {
        std::cerr << "Set bot token using BOT_TOKEN enviroment variable.\n"
                  << "E.g. env BOT_TOKEN=token_here CHANNEL_ID=id_here " << argv[0] << " [count]\n";
        return 1;
    }

    const char* channelIdStr = std::getenv("CHANNEL_ID");
    if (!channelIdStr) {
        std::cerr << "Set target channel using CHANNEL_ID enviroment variable.\n";
        return 1;
    }
    Ratecord::Snowflake channelId(channelIdStr);

    unsigned count = argc > 1 ? std::strtoul(argv[1], nullptr, 10) : 20;

    Ratecord::RestClient client(botToken);
    Ratecord::Dispatcher& dispatcher = client.dispatcher();

    // Watch dispatcher waiting for quota instead of failing.
    dispatcher.events.addHandler(Ratecord::RestEvent::RateLimit, [](const nlohmann::json& payload) {
        std::cerr << "Ratelimited on " << payload["route"].get<std::string>()
                  << ", retrying in " << payload["retry_after_ms"] << "ms"
                  << (payload["global"].get<bool>() ? " (global)\n" : "\n");
    });

    std::vector<std::future<nlohmann::json> > results;
    for (unsigned i = 0; i < count; ++i) {
        nlohmann::json message {
            { "content", std::string("Message #") + std::to_string(i + 1) + " of " + std::to_string(count) }
        };
        results.push_back(dispatcher.requestAsync("POST", Ratecord::Endpoints::channelMessages(channelId),
                                                  Ratecord::RequestBody::structured(message)));
    }

    // Messages arrive in submission order, since all of them share one bucket.
    int failures = 0;
    for (unsigned i = 0; i < results.size(); ++i) {
        try {
            nlohmann::json sent = results[i].get();
            std::cout << "Sent #" << i + 1 << ", id " << sent["id"].get<std::string>() << '\n';
        } catch (const Ratecord::RuntimeError& excp) {
            std::cerr << "Failed #" << i + 1 << ": " << excp.what() << '\n';
            ++failures;
        }
    }

    std::cout << "Last request latency: " << dispatcher.latency().count() << "ms\n";
    return failures == 0 ? 0 : 2;
}
