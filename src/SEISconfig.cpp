#include <cstdio>
#include <fstream>
#include <limits>
#include <sstream>
#include <nlohmann/json.hpp>
#include "SEISconfig.hpp"

namespace SEIS{

    bool parse_config(const std::string& text, ReceiverConfig& out){
        using nlohmann::json;

        json j;
        try {
            j = json::parse(text);
        } catch (const json::exception& e) {
            std::fprintf(stderr, "[config] %s\n", e.what());
            return false;
        }
        if (!j.is_object()) return false;

        ReceiverConfig cfg = out;
        try {
            if (j.contains("ipv6")) cfg.ipv6 = j["ipv6"].get<bool>();
            if (j.contains("bind")) cfg.bind = j["bind"].get<std::string>();
            if (j.contains("port")) {
                const auto& p = j["port"];
                if (!p.is_number_integer()) return false;
                const auto port = p.get<int64_t>();
                if (port < 0 || port > 65535) return false;
                cfg.port = static_cast<uint16_t>(port);
            }
            if (j.contains("drop_on_backward")) cfg.drop_on_backward = j["drop_on_backward"].get<bool>();
            if (j.contains("receive_timeout_ms")) {
                const auto& t = j["receive_timeout_ms"];
                if (!t.is_number_integer()) return false;
                const auto ms = t.get<int64_t>();
                if (ms < 0 || ms > std::numeric_limits<int>::max()) return false;
                cfg.receive_timeout_ms = static_cast<int>(ms);
            }
        } catch (const json::exception& e) {
            std::fprintf(stderr, "[config] %s\n", e.what());
            return false;
        }

        out = cfg;
        return true;
    }

    bool load_config(const std::string& path, ReceiverConfig& out){
        std::ifstream in(path);
        if (!in) {
            std::fprintf(stderr, "[config] cannot open %s\n", path.c_str());
            return false;
        }
        std::stringstream ss;
        ss << in.rdbuf();
        return parse_config(ss.str(), out);
    }
}
