// Minimal host wiring: a canned transport, an in-memory store, a few flag
// reads, one tracked event and a clean shutdown.
//
// Usage: basic_flags [options.json]

#include "flagsync/flagsync.hpp"

#include <jwt-cpp/traits/nlohmann-json/defaults.h>
#include <iostream>

using namespace flagsync;

/// Serves a fixed settings/config pair and accepts every POST.
class CannedTransport : public ITransport {
public:
    Result<HttpResponse> post(const std::string& url, const std::string& body) override {
        std::cout << "POST " << url << " (" << body.size() << " bytes)\n";
        return HttpResponse{ 202, "", {} };
    }

    Result<HttpMetadata> fetchMetadata(const std::string&) override {
        HttpMetadata m;
        m.etag = "\"demo-1\"";
        return m;
    }

    Result<HttpResponse> fetchFull(const std::string& url,
                                   const std::optional<std::string>&,
                                   const std::optional<std::string>&) override {
        HttpResponse r;
        r.status = 200;
        r.metadata.etag = "\"demo-1\"";
        if (url.find("cf-sdk-settings.json") != std::string::npos) {
            r.body = R"({"cf_account_enabled": true, "cf_skip_sdk": false})";
        } else {
            r.body = R"({"configs": {
                "hero_text": {"variation": "Hello", "config_id": "c1", "variation_id": "v1",
                              "version": "3", "experience_id": "e1"},
                "dark_mode": {"variation": true, "config_id": "c2", "variation_id": "v2",
                              "version": "1", "experience_id": "e2"},
                "max_items": {"variation": 25}
            }})";
        }
        return r;
    }
};

int main(int argc, char** argv) {
    ClientOptions opts;
    try {
        if (argc > 1) opts = ClientOptions::fromFile(argv[1]);
    } catch (const std::invalid_argument& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }
    if (opts.clientKey.empty()) {
        opts.clientKey = jwt::create()
            .set_type("JWT")
            .set_payload_claim("dimension_id", jwt::claim(std::string("demo-dimension")))
            .sign(jwt::algorithm::hs256{ "demo-secret" });
    }
    opts.logLevel = "DEBUG";
    opts.user = UserContext::identified("demo-user", { { "plan", "free" } });

    try {
        Client client(opts, { std::make_shared<CannedTransport>() });

        auto sub = client.addFlagListener("hero_text", [](const std::string& key, const ConfigValue& v) {
            std::cout << key << " changed to " << v.toJson().dump() << "\n";
        });

        client.start();
        std::cout << "check: " << toString(client.checkSettings()) << "\n";

        std::cout << "hero_text = " << client.getString("hero_text", "Hi") << "\n";
        std::cout << "dark_mode = " << std::boolalpha << client.getBoolean("dark_mode", false) << "\n";
        std::cout << "max_items = " << client.getNumber("max_items", 10) << "\n";

        auto tracked = client.trackEvent("example_opened", { { "source", "cli" } });
        if (!tracked.ok()) std::cerr << "trackEvent: " << tracked.error().describe() << "\n";

        std::cout << client.metrics().dump(2) << "\n";
        client.shutdown();
    } catch (const std::invalid_argument& ex) {
        std::cerr << "invalid options: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}
