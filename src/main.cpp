/*
 * Esta parse driver (esta-parse)
 * Reads an Esta program from a file (or stdin), parses it and prints the AST
 * as an S-expression or as canonical source. Parse failures are reported as
 * file:line:col diagnostics on stderr.
 */
#include <esta/lex/lexer.hpp>
#include <esta/parse/parser.hpp>
#include <esta/parse/printer.hpp>
#include <esta/cli/config.hpp>

#include <cstddef>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

using namespace esta;

static Config g_cfg;

static std::string apply_color(const std::string& s, const char* code){ if(!g_cfg.color) return s; return std::string("\x1b[")+code+"m"+s+"\x1b[0m"; }

static void usage(){
    std::cerr << "Usage: esta-parse [--sexpr|--source] [--legacy-for] [--quiet] [--no-color] [--verbose]\n"
                 "                  [--config <path>] [file|-]\n";
}

// 1-based line and column of a byte offset.
static std::pair<std::size_t,std::size_t> line_col(const std::string& src, std::size_t pos){
    std::size_t line=1, col=1;
    for(std::size_t i=0;i<pos && i<src.size();++i){ if(src[i]=='\n'){ ++line; col=1; } else ++col; }
    return {line,col};
}

static void report(const std::string& name, const std::string& src, const ParseError& err){
    auto [line,col] = line_col(src, err.pos);
    std::cerr << name << ":" << line << ":" << col << ": "
              << apply_color(std::string(error_kind_name(err.kind)) + " error:", "1;31")
              << " " << err.message << std::endl;
}

static bool read_input(const std::string& path, std::string& out){
    std::ostringstream ss;
    if(path.empty() || path=="-"){ ss << std::cin.rdbuf(); out=ss.str(); return true; }
    std::ifstream in(path);
    if(!in) return false;
    ss << in.rdbuf(); out=ss.str();
    return true;
}

int main(int argc, char* argv[]) {
    std::string config_path;
    for(int i=1;i<argc;++i){
        std::string a=argv[i];
        if(a!="--config") continue;
        if(i+1>=argc){ std::cerr << "esta-parse: --config needs a path" << std::endl; usage(); return 1; }
        config_path=argv[++i];
    }
    if(!load_startup_config(config_path, g_cfg)){
        std::cerr << "esta-parse: cannot read config " << (config_path.empty() ? default_config_path() : config_path) << std::endl;
        return 1;
    }

    std::string path; bool quiet=false;
    for(int i=1;i<argc;++i){
        std::string a=argv[i];
        if(a=="--sexpr") g_cfg.output=OutputFormat::SExpr;
        else if(a=="--source") g_cfg.output=OutputFormat::Source;
        else if(a=="--legacy-for") g_cfg.for_syntax=ForSyntax::Legacy;
        else if(a=="--quiet"||a=="-q") quiet=true;
        else if(a=="--verbose"||a=="-v") g_cfg.verbose=true;
        else if(a=="--no-color") g_cfg.color=false;
        else if(a=="--config") ++i;
        else if(a=="--help"||a=="-h"){ usage(); return 0; }
        else if(a.size()>1 && a[0]=='-'){ std::cerr << "esta-parse: unknown option " << a << std::endl; usage(); return 1; }
        else if(path.empty()) path=a;
        else { usage(); return 1; }
    }

    std::string source;
    if(!read_input(path, source)){ std::perror(("open " + path).c_str()); return 1; }
    std::string name = (path.empty() || path=="-") ? "<stdin>" : path;

    Lexer lex(source);
    auto tokens = lex.run();
    if(g_cfg.verbose) std::cerr << "esta-parse: " << name << ": " << tokens.size() << " tokens" << std::endl;

    ParserOptions opts; opts.for_syntax = g_cfg.for_syntax;
    auto result = parse_tokens(tokens, opts);
    if(!result.ok()){ report(name, source, *result.error); return 2; }
    if(g_cfg.verbose) std::cerr << "esta-parse: " << name << ": " << result.value.statements.size() << " top-level statements" << std::endl;

    if(quiet) return 0;
    if(g_cfg.output==OutputFormat::Source) std::cout << to_source(result.value, g_cfg.for_syntax);
    else { std::string out = dump(result.value); if(!out.empty()) std::cout << out << "\n"; }
    return 0;
}
