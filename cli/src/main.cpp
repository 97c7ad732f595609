#include "sealcookie.hpp"
#include "config_io.hpp"
#include "codec.hpp"

#include <iostream>
#include <fstream>
#include <iterator>
#include <string>
#include <cstring>
#include <stdexcept>

// ── Usage ─────────────────────────────────────────────────────────────────────

static void print_usage(const char* prog) {
    std::cerr <<
        "Usage:\n"
        "  " << prog << " seal --config <file> [<payload-file>]\n"
        "  " << prog << " open --config <file> [<cookie-file>]\n"
        "\n"
        "  --config  YAML file with algorithm, iv-length and secret (or secret-hex)\n"
        "\n"
        "  seal: reads a JSON object or array (stdin if no file), writes the cookie value to stdout\n"
        "  open: reads a cookie value (stdin if no file), writes the session as JSON to stdout\n"
        "\n"
        "Exit codes: 0=ok, 1=usage/config, 2=rejected, 3=I/O\n";
}

// ── Input ─────────────────────────────────────────────────────────────────────

static std::string read_input(const std::string& path) {
    if (path.empty() || path == "-") {
        return std::string((std::istreambuf_iterator<char>(std::cin)),
                            std::istreambuf_iterator<char>());
    }
    std::ifstream f(path, std::ios::binary);
    if (!f)
        throw std::runtime_error("Cannot open file: " + path);
    return std::string((std::istreambuf_iterator<char>(f)),
                        std::istreambuf_iterator<char>());
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Config mistakes are usage errors; everything else means the input was refused.
static int exit_code_for(const sealcookie::Error& e) {
    return e.kind() == sealcookie::ErrorKind::InvalidConfig ? 1 : 2;
}

// ── seal command ──────────────────────────────────────────────────────────────

static int cmd_seal(const sealcookie::CipherConfig& cfg, const std::string& input_path) {
    std::string text;
    try {
        text = read_input(input_path);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }

    sealcookie::Json payload;
    try {
        payload = sealcookie::Json::parse(text);
    } catch (const sealcookie::Json::exception& e) {
        std::cerr << "Error: cannot parse payload: " << e.what() << "\n";
        return 2;
    }

    try {
        std::cout << sealcookie::encode(payload, cfg) << "\n";
    } catch (const sealcookie::Error& e) {
        std::cerr << "Error: seal failed (" << sealcookie::kind_name(e.kind()) << "): "
                  << e.what() << "\n";
        return exit_code_for(e);
    }
    return 0;
}

// ── open command ──────────────────────────────────────────────────────────────

static int cmd_open(const sealcookie::CipherConfig& cfg, const std::string& input_path) {
    std::string cookie;
    try {
        cookie = trim(read_input(input_path));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }

    try {
        sealcookie::Json session = sealcookie::decode(cookie, cfg);
        std::cout << codec::serialize(session) << "\n";
    } catch (const sealcookie::Error& e) {
        std::cerr << "Error: open failed (" << sealcookie::kind_name(e.kind()) << "): "
                  << e.what() << "\n";
        return exit_code_for(e);
    }
    return 0;
}

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "--help" || cmd == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    if (cmd != "seal" && cmd != "open") {
        std::cerr << "Error: unknown command '" << cmd << "'\n";
        print_usage(argv[0]);
        return 1;
    }

    std::string config_path;
    std::string input_path;

    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0) {
            if (++i >= argc) {
                std::cerr << "Error: --config requires a filename\n";
                return 1;
            }
            config_path = argv[i];
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            std::cerr << "Error: unknown option '" << argv[i] << "'\n";
            return 1;
        } else {
            if (!input_path.empty()) {
                std::cerr << "Error: unexpected argument '" << argv[i] << "'\n";
                return 1;
            }
            input_path = argv[i];
        }
    }

    if (config_path.empty()) {
        std::cerr << "Error: --config is required\n";
        return 1;
    }

    sealcookie::CipherConfig cfg;
    try {
        cfg = load_config(config_path);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (cmd == "seal")
        return cmd_seal(cfg, input_path);
    return cmd_open(cfg, input_path);
}
