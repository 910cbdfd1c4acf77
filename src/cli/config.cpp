/*
 * Esta Driver Configuration Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <esta/cli/config.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace esta {

static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }

static bool parse_bool(const std::string& val, bool& out) {
    if (val=="1"||val=="true"||val=="on") { out=true; return true; }
    if (val=="0"||val=="false"||val=="off") { out=false; return true; }
    return false;
}

bool apply_config_line(const std::string& raw, Config& cfg) {
    std::string line = trim(raw);
    if (line.empty() || line[0]=='#') return false;
    auto eq = line.find('=');
    if (eq==std::string::npos) return false;
    std::string key = trim(line.substr(0,eq)), val = trim(line.substr(eq+1));
    if (key=="for_syntax") {
        if (val=="legacy") { cfg.for_syntax = ForSyntax::Legacy; return true; }
        if (val=="conventional") { cfg.for_syntax = ForSyntax::Conventional; return true; }
    }
    else if (key=="output") {
        if (val=="sexpr") { cfg.output = OutputFormat::SExpr; return true; }
        if (val=="source") { cfg.output = OutputFormat::Source; return true; }
    }
    else if (key=="color") return parse_bool(val, cfg.color);
    else if (key=="verbose") return parse_bool(val, cfg.verbose);
    return false;
}

bool load_config(const std::string& path, Config& cfg) {
    std::ifstream in(path); if (!in) return false;
    std::string line; while (std::getline(in,line)) apply_config_line(line, cfg);
    return true;
}

std::string default_config_path() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + "/.estarc";
}

bool load_startup_config(const std::string& explicit_path, Config& cfg) {
    if (!explicit_path.empty()) return load_config(explicit_path, cfg);
    std::string home_rc = default_config_path();
    std::error_code ec;
    if (home_rc.empty() || !std::filesystem::exists(home_rc, ec)) return true;
    return load_config(home_rc, cfg);
}

} // namespace esta
