#include "su3.hpp"
#include "su3_codec.hpp"
#include "su3_content.hpp"
#include "su3_digest.hpp"
#include "su3_types.hpp"
#include "yaml_io.hpp"

#include <iostream>
#include <fstream>
#include <iterator>
#include <vector>
#include <string>
#include <cstring>
#include <cstdlib>
#include <stdexcept>
#include <utility>

// ── Usage ─────────────────────────────────────────────────────────────────────

static void print_usage(const char* prog) {
    std::cerr <<
        "Usage:\n"
        "  " << prog << " info    <file.su3>\n"
        "  " << prog << " extract [--raw] --out <file> <file.su3>\n"
        "  " << prog << " digest  <file.su3>\n"
        "  " << prog << " build   --manifest <yaml> --content <file>\n"
        "                 [--signature <file>] [--gzip] [--out <file>]\n"
        "\n"
        "  info:    decode and print a YAML summary to stdout\n"
        "  extract: write the content (gunzipped for xml.gz / txt.gz unless --raw)\n"
        "  digest:  print the hex digest of the signed region\n"
        "  build:   pack content per manifest; without --signature the signature\n"
        "           is zero-filled at the length the signature type requires\n"
        "\n"
        "Exit codes: 0=ok, 1=usage, 2=format, 3=I/O\n";
}

// ── File I/O ──────────────────────────────────────────────────────────────────

static std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f)
        throw std::runtime_error("Cannot open file: " + path);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(f)),
                                 std::istreambuf_iterator<char>());
}

static void write_output(const std::string& path, const std::vector<uint8_t>& data) {
    if (path.empty() || path == "-") {
        std::cout.write(reinterpret_cast<const char*>(data.data()),
                        static_cast<std::streamsize>(data.size()));
        if (!std::cout) throw std::runtime_error("Write error on stdout");
        return;
    }
    std::ofstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("Cannot open output file: " + path);
    f.write(reinterpret_cast<const char*>(data.data()),
            static_cast<std::streamsize>(data.size()));
    if (!f) throw std::runtime_error("Write error: " + path);
}

// Reads and decodes path. Returns 0 and fills pkg, or an exit code.
static int load_package(const std::string& path, su3::Package& pkg) {
    std::vector<uint8_t> raw;
    try {
        raw = read_file(path);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }

    try {
        su3::Decoded d = su3::decode(raw);
        if (!d.rest.empty())
            std::cerr << "Warning: " << d.rest.size()
                      << " trailing bytes after signature in " << path << "\n";
        pkg = std::move(d.package);
    } catch (const su3::Error& e) {
        std::cerr << "Error: " << path << ": " << e.what() << "\n";
        return 2;
    }
    return 0;
}

// ── info command ──────────────────────────────────────────────────────────────

static int cmd_info(const std::string& path) {
    su3::Package pkg;
    int rc = load_package(path, pkg);
    if (rc != 0) return rc;

    if (pkg.raw_signature.size() != su3::signature_length(pkg.signature_type))
        std::cerr << "Warning: signature is " << pkg.raw_signature.size()
                  << " bytes, " << su3::to_string(pkg.signature_type)
                  << " expects " << su3::signature_length(pkg.signature_type) << "\n";
    if (pkg.raw_version.size() < su3::kMinVersionLength)
        std::cerr << "Warning: version field is only " << pkg.raw_version.size()
                  << " bytes\n";

    std::cout << su3::emit_package_yaml(pkg);
    return 0;
}

// ── extract command ───────────────────────────────────────────────────────────

static int cmd_extract(const std::string& path, const std::string& out_path, bool raw) {
    su3::Package pkg;
    int rc = load_package(path, pkg);
    if (rc != 0) return rc;

    std::vector<uint8_t> body;
    try {
        body = raw ? pkg.raw_content : su3::content(pkg);
    } catch (const su3::Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    try {
        write_output(out_path, body);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }
    return 0;
}

// ── digest command ────────────────────────────────────────────────────────────

static int cmd_digest(const std::string& path) {
    std::vector<uint8_t> raw;
    try {
        raw = read_file(path);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }

    // Hash the file's own bytes; re-encoding would zero the unused header fields.
    try {
        su3::Decoded d = su3::decode(raw);
        std::vector<uint8_t> md = su3::signed_region_digest(raw);
        std::cout << su3::digest_name(d.package.signature_type) << " "
                  << su3::to_hex(md) << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << path << ": " << e.what() << "\n";
        return 2;
    }
    return 0;
}

// ── build command ─────────────────────────────────────────────────────────────

static int cmd_build(const std::string& manifest_path,
                     const std::string& content_path,
                     const std::string& sig_path,
                     const std::string& out_path,
                     bool gzip)
{
    su3::Manifest m;
    try {
        m = su3::load_manifest(manifest_path);
    } catch (const std::exception& e) {
        std::cerr << "Error: cannot load manifest: " << e.what() << "\n";
        return 2;
    }

    std::vector<uint8_t> body;
    try {
        body = read_file(content_path);
        if (!sig_path.empty())
            m.signature = read_file(sig_path);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }

    if (gzip) {
        if (!su3::is_gzip_file_type(m.file_type))
            std::cerr << "Warning: --gzip with file type "
                      << su3::to_string(m.file_type) << "\n";
        try {
            body = su3::gzip_bytes(body);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 2;
        }
    }

    const uint16_t want = su3::signature_length(m.signature_type);
    if (m.signature.empty()) {
        std::cerr << "Warning: no signature given, writing " << want
                  << " zero bytes\n";
        m.signature.assign(want, 0x00);
    } else if (m.signature.size() != want) {
        std::cerr << "Error: signature is " << m.signature.size() << " bytes, "
                  << su3::to_string(m.signature_type) << " requires " << want << "\n";
        return 2;
    }

    std::vector<uint8_t> wire;
    try {
        wire = su3::encode(su3::make_package(m, body));
    } catch (const su3::Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    try {
        write_output(out_path, wire);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }

    if (!out_path.empty() && out_path != "-")
        std::cerr << "Wrote " << wire.size() << " bytes to " << out_path << "\n";
    return 0;
}

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string cmd = argv[1];
    std::string out_path, manifest_path, content_path, sig_path;
    std::vector<std::string> positional;
    bool raw = false, gzip = false;

    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "--out") == 0) {
            if (++i >= argc) { std::cerr << "Error: --out requires a filename\n"; return 1; }
            out_path = argv[i];
        } else if (std::strcmp(argv[i], "--manifest") == 0) {
            if (++i >= argc) { std::cerr << "Error: --manifest requires a filename\n"; return 1; }
            manifest_path = argv[i];
        } else if (std::strcmp(argv[i], "--content") == 0) {
            if (++i >= argc) { std::cerr << "Error: --content requires a filename\n"; return 1; }
            content_path = argv[i];
        } else if (std::strcmp(argv[i], "--signature") == 0) {
            if (++i >= argc) { std::cerr << "Error: --signature requires a filename\n"; return 1; }
            sig_path = argv[i];
        } else if (std::strcmp(argv[i], "--raw") == 0) {
            raw = true;
        } else if (std::strcmp(argv[i], "--gzip") == 0) {
            gzip = true;
        } else if (argv[i][0] == '-' && argv[i][1] == '-') {
            std::cerr << "Error: unknown option " << argv[i] << "\n";
            return 1;
        } else {
            positional.push_back(argv[i]);
        }
    }

    if (cmd == "info" || cmd == "digest") {
        if (positional.size() != 1) { print_usage(argv[0]); return 1; }
        return cmd == "info" ? cmd_info(positional[0]) : cmd_digest(positional[0]);
    }
    if (cmd == "extract") {
        if (positional.size() != 1 || out_path.empty()) { print_usage(argv[0]); return 1; }
        return cmd_extract(positional[0], out_path, raw);
    }
    if (cmd == "build") {
        if (!positional.empty() || manifest_path.empty() || content_path.empty()) {
            print_usage(argv[0]);
            return 1;
        }
        return cmd_build(manifest_path, content_path, sig_path, out_path, gzip);
    }

    std::cerr << "Error: unknown command '" << cmd << "'\n";
    print_usage(argv[0]);
    return 1;
}
