// Basic JsonWeave usage example
// Compile: g++ -std=c++23 -I../include basic_usage.cpp -lyyjson -o basic_usage

#include <JsonWeave/JsonWeave.hpp>
#include <iostream>
#include <string>

using namespace JsonWeave;
using namespace JsonWeave::options;

enum class Stage {
    Dev,
    Prod
};

template<> struct JsonWeave::EnumMeta<Stage> {
    using Values = EnumValues<EnumValue<Stage::Dev, "dev">, EnumValue<Stage::Prod, "prod">>;
};

struct Config {
    struct Server {
        std::string host;
        int port;
    };

    Annotated<std::string, key<"appName">> app_name;
    int version;
    Stage stage;
    Annotated<std::optional<std::string>, key<"owner">, omit_empty> owner;
    std::vector<Server> servers;
    Annotated<std::chrono::year_month_day, key<"releasedOn">> released_on;
};

int main() {
    const char* json = R"({
        "appName": "MyApp",
        "version": 1,
        "stage": "prod",
        "servers": [
            {"host": "localhost", "port": 8080},
            {"host": "backup", "port": 8081}
        ],
        "releasedOn": "2024-05-01",
        "comment": "unknown keys are ignored"
    })";

    Config config;
    auto result = UnmarshalFromString(config, std::string_view(json));

    if (!result) {
        std::cout << ResultToString(result) << std::endl;
        return 1;
    }

    std::cout << "Successfully unmarshalled!" << std::endl;
    std::cout << "App: " << config.app_name.get() << std::endl;
    std::cout << "Version: " << config.version << std::endl;
    std::cout << "Servers: " << config.servers.size() << std::endl;

    config.version ++;
    std::string out;
    auto written = MarshalToString(config, out);
    if (!written) {
        std::cout << ResultToString(written) << std::endl;
        return 1;
    }
    std::cout << out << std::endl;
    /* {"appName":"MyApp","version":2,"stage":"prod","servers":[...],"releasedOn":"2024-05-01"} */

    return 0;
}
