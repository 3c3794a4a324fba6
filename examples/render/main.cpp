// main.cpp
#include <fstream>
#include <iostream>
#include <optional>
#include <nlohmann/json.hpp>
#include "mvcore/config/app_config.h"
#include "mvcore/sql/query_builder.h"
#include "mvcore/views/engine.h"

int main(int argc, char* argv[]) {
    if (argc < 3 || argc > 5) {
        std::cerr << "Usage: " << argv[0] << " <config.yaml> <view> [data.json] [layout]\n";
        return 1;
    }

    try {
        // 1. Load config and apply log level
        auto config = mvcore::AppConfig::from_file(argv[1]);
        config.apply_logging();

        // 2. Model
        nlohmann::json data = nlohmann::json::object();
        if (argc >= 4) {
            std::ifstream data_file(argv[3]);
            if (!data_file.is_open()) {
                std::cerr << "[ERROR] Cannot open data file: " << argv[3] << "\n";
                return 1;
            }
            data = nlohmann::json::parse(data_file);
        }

        // 3. Engine
        mvcore::ViewEngine engine(config.views);
        engine.set_conf(config.to_json());
        engine.register_function("sql_preview", [&config](const std::vector<nlohmann::json>& args,
                                                           const mvcore::RenderContext&) {
            if (args.empty() || !args[0].is_string()) return nlohmann::json();
            mvcore::sql::QueryBuilder query(config.backend);
            query.from(args[0].get<std::string>()).limit(10);
            return nlohmann::json(query.build().sql);
        });

        std::optional<std::string> layout;
        if (argc == 5) {
            layout = argv[4];
        }

        // 4. Render
        std::cout << engine.render(argv[2], data, layout) << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
