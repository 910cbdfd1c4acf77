/*
 * Esta Driver Configuration
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Settings for the esta-parse driver, read from ~/.estarc (key=value per
 *   line, '#' comments). Unknown keys and malformed lines are ignored.
 */
#pragma once
#include <string>
#include "esta/parse/parser.hpp"

namespace esta {

enum class OutputFormat { SExpr, Source };

struct Config {
    ForSyntax for_syntax = ForSyntax::Conventional; // for_syntax=conventional|legacy
    OutputFormat output = OutputFormat::SExpr;      // output=sexpr|source
    bool color = true;                              // color
    bool verbose = false;                           // verbose
};

// Returns false if the file cannot be opened (cfg left untouched).
bool load_config(const std::string& path, Config& cfg);

// Applies a single "key=value" line; returns true if it recognized and
// applied a setting, even one that already had that value.
bool apply_config_line(const std::string& line, Config& cfg);

// $HOME/.estarc, or empty if HOME is unset.
std::string default_config_path();

// Settings the driver starts from. An explicit path (from --config) must be
// readable; otherwise ~/.estarc is applied when it exists. Returns false only
// when the explicit file cannot be opened.
bool load_startup_config(const std::string& explicit_path, Config& cfg);

} // namespace esta
