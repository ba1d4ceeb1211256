#include "yaml_io.hpp"
#include "su3_types.hpp"
#include "su3_text.hpp"
#include "su3_error.hpp"
#include "su3_digest.hpp"
#include "base64.hpp"
#include <yaml-cpp/yaml.h>
#include <cctype>
#include <stdexcept>
#include <string>

namespace su3 {

// ── Manifest parsing ──────────────────────────────────────────────────────────

static bool is_number(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
    }
    return true;
}

// Type keys accept either the name or the numeric wire code.
static unsigned long parse_code(const std::string& s, unsigned long max, const char* key) {
    unsigned long v = std::stoul(s);
    if (v > max)
        throw std::runtime_error(std::string("manifest: '") + key + "' code out of range: " + s);
    return v;
}

static SignatureType read_signature_type(const YAML::Node& node) {
    std::string s = node.as<std::string>();
    if (is_number(s))
        return signature_type_from_code((uint16_t)parse_code(s, 0xFFFF, "signature-type"));
    return signature_type_from_name(s);
}

static FileType read_file_type(const YAML::Node& node) {
    std::string s = node.as<std::string>();
    if (is_number(s))
        return file_type_from_code((uint8_t)parse_code(s, 0xFF, "file-type"));
    return file_type_from_name(s);
}

static ContentType read_content_type(const YAML::Node& node) {
    std::string s = node.as<std::string>();
    if (is_number(s))
        return content_type_from_code((uint8_t)parse_code(s, 0xFF, "content-type"));
    return content_type_from_name(s);
}

static Manifest manifest_from_node(const YAML::Node& doc) {
    if (!doc || !doc.IsMap())
        throw std::runtime_error("manifest: top-level node must be a map");

    Manifest m;
    if (doc["signature-type"]) m.signature_type = read_signature_type(doc["signature-type"]);
    if (doc["file-type"])      m.file_type      = read_file_type(doc["file-type"]);
    if (doc["content-type"])   m.content_type   = read_content_type(doc["content-type"]);

    if (!doc["version"])
        throw std::runtime_error("manifest: missing 'version'");
    if (!doc["signer-id"])
        throw std::runtime_error("manifest: missing 'signer-id'");

    m.version   = doc["version"].as<std::string>();
    m.signer_id = doc["signer-id"].as<std::string>();

    // Both lengths are single header bytes.
    if (m.version.size() > 255)
        throw std::runtime_error("manifest: 'version' longer than 255 bytes");
    if (m.signer_id.empty() || m.signer_id.size() > 255)
        throw std::runtime_error("manifest: 'signer-id' must be 1..255 bytes");

    if (doc["signature"])
        m.signature = base64_decode(doc["signature"].as<std::string>());

    return m;
}

Manifest parse_manifest(const std::string& yaml_text) {
    return manifest_from_node(YAML::Load(yaml_text));
}

Manifest load_manifest(const std::string& path) {
    return manifest_from_node(YAML::LoadFile(path));
}

Package make_package(const Manifest& m, const std::vector<uint8_t>& content) {
    Package pkg;
    pkg.signature_type = m.signature_type;
    pkg.file_type      = m.file_type;
    pkg.content_type   = m.content_type;
    pkg.raw_version    = pad_version(m.version);
    pkg.raw_signer_id.assign(m.signer_id.begin(), m.signer_id.end());
    pkg.raw_content    = content;
    pkg.raw_signature  = m.signature;
    return pkg;
}

// ── Summary emission ──────────────────────────────────────────────────────────

// Multi-line values carry no trailing newline so yaml-cpp emits '|-'.
static std::string b64_for_yaml(const std::vector<uint8_t>& data) {
    std::string b64 = base64_encode(data);
    if (b64.size() <= 64)
        return b64;

    std::string out;
    out.reserve(b64.size() + b64.size() / 64);
    for (size_t i = 0; i < b64.size(); i += 64) {
        if (i > 0) out += '\n';
        out += b64.substr(i, 64);
    }
    return out;
}

// Text form of a region, or "hex:<...>" when it is not UTF-8.
static std::string text_or_hex(const Package& pkg, bool version) {
    try {
        return version ? version_text(pkg) : signer_id_text(pkg);
    } catch (const Error& e) {
        if (e.kind() != ErrorKind::TextDecode) throw;
        return "hex:" + to_hex(version ? pkg.raw_version : pkg.raw_signer_id);
    }
}

std::string emit_package_yaml(const Package& pkg) {
    YAML::Emitter out;

    out << YAML::BeginDoc;
    out << YAML::BeginMap;

    out << YAML::Key << "signature-type" << YAML::Value << to_string(pkg.signature_type);
    out << YAML::Key << "file-type"      << YAML::Value << to_string(pkg.file_type);
    out << YAML::Key << "content-type"   << YAML::Value << to_string(pkg.content_type);
    out << YAML::Key << "version"        << YAML::Value << text_or_hex(pkg, true);
    out << YAML::Key << "signer-id"      << YAML::Value << text_or_hex(pkg, false);

    out << YAML::Key << "lengths" << YAML::Value;
    out << YAML::BeginMap;
    out << YAML::Key << "version"   << YAML::Value << pkg.raw_version.size();
    out << YAML::Key << "signer-id" << YAML::Value << pkg.raw_signer_id.size();
    out << YAML::Key << "content"   << YAML::Value << pkg.raw_content.size();
    out << YAML::Key << "signature" << YAML::Value << pkg.raw_signature.size();
    out << YAML::EndMap;

    std::string sig = b64_for_yaml(pkg.raw_signature);
    out << YAML::Key << "signature" << YAML::Value;
    if (sig.find('\n') != std::string::npos)
        out << YAML::Literal;
    out << sig;

    out << YAML::EndMap;
    out << YAML::EndDoc;

    return std::string(out.c_str()) + "\n";
}

} // namespace su3
