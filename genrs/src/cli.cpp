#include "cli.hpp"
#include "random.hpp"
#include "encoding.hpp"
#include "presets.hpp"
#include "uuid.hpp"
#include "yaml_io.hpp"
#include <cstring>

#ifndef GENRS_VERSION
#define GENRS_VERSION "0.0.0"
#endif

// ── Usage ─────────────────────────────────────────────────────────────────────

static void print_usage(std::ostream& os, const char* prog) {
    os <<
        "Usage: " << prog << " [options]\n"
        "\n"
        "Generates random keys and UUIDs.\n"
        "\n"
        "Options:\n"
        "  -m, --mode <key|uuid>          What to generate (default: key)\n"
        "  -p, --preset <name>            Key preset; overrides --length\n"
        "  -f, --format <hex|base64>      Key encoding (default: hex)\n"
        "  -l, --length <bytes>           Key length in bytes (default: 32)\n"
        "  -u, --uuid-version <v1|v3|v4|v5>\n"
        "                                 UUID version (default: v4)\n"
        "  -n, --namespace <uuid|dns|url|oid|x500>\n"
        "                                 Namespace for UUID v3/v5\n"
        "  -N, --name <text>              Name for UUID v3/v5\n"
        "      --yaml                     Print a YAML document instead of the bare value\n"
        "  -h, --help                     Show this help\n"
        "  -V, --version                  Show version\n"
        "\n"
        "Presets:\n";

    size_t count = 0;
    const PresetInfo* presets = preset::table(count);
    for (size_t i = 0; i < count; ++i) {
        std::string name = presets[i].name;
        name.resize(12, ' ');
        os << "  " << name << presets[i].bytes << " bytes  (" << presets[i].description << ")\n";
    }

    os <<
        "\n"
        "Examples:\n"
        "  " << prog << " --length 16 --format hex\n"
        "  " << prog << " --preset aes256 --format base64\n"
        "  " << prog << " --mode uuid --uuid-version v5 --namespace dns --name example.com\n"
        "\n"
        "Exit codes: 0=ok, 1=usage, 2=crypto, 3=I/O\n";
}

// ── Argument parser ───────────────────────────────────────────────────────────

bool parse_args(int argc, char** argv, Args& args, std::ostream& err) {
    for (int i = 1; i < argc; ++i) {
        std::string opt = argv[i];
        auto need_val = [&]() -> bool {
            if (i + 1 >= argc) {
                err << "Error: option " << opt << " requires a value\n";
                return false;
            }
            return true;
        };

        if (opt == "--help" || opt == "-h") {
            args.help = true;
        } else if (opt == "--version" || opt == "-V") {
            args.version = true;
        } else if (opt == "--yaml") {
            args.yaml = true;
        } else if (opt == "--mode" || opt == "-m") {
            if (!need_val()) return false;
            args.mode = argv[++i];
        } else if (opt == "--preset" || opt == "-p") {
            if (!need_val()) return false;
            args.preset = argv[++i];
        } else if (opt == "--format" || opt == "-f") {
            if (!need_val()) return false;
            args.format = argv[++i];
        } else if (opt == "--length" || opt == "-l") {
            if (!need_val()) return false;
            args.length = argv[++i];
        } else if (opt == "--uuid-version" || opt == "-u") {
            if (!need_val()) return false;
            args.uuid_version = argv[++i];
        } else if (opt == "--namespace" || opt == "-n") {
            if (!need_val()) return false;
            args.ns = argv[++i];
        } else if (opt == "--name" || opt == "-N") {
            if (!need_val()) return false;
            args.name = argv[++i];
        } else {
            err << "Error: unknown option: " << opt << "\n\n";
            return false;
        }
    }
    return true;
}

int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::RandomSourceUnavailable:
        case ErrorKind::DigestFailure:
            return EXIT_CRYPTO;
        default:
            return EXIT_USAGE;
    }
}

int report_error(const std::exception& e, std::ostream& err) {
    if (auto* ge = dynamic_cast<const GenError*>(&e)) {
        err << "Error: " << ge->what() << "\n";
        return exit_code_for(ge->kind());
    }
    err << "Error: internal error: " << e.what() << "\n";
    return EXIT_CRYPTO;
}

// ── Validation ────────────────────────────────────────────────────────────────

struct Request {
    bool        uuid_mode = false;
    KeyRequest  key;
    UuidRequest uuid;
};

// Every option given is checked, whichever mode it belongs to.
static Request build_request(const Args& args) {
    Request req;
    if (args.mode == "uuid")
        req.uuid_mode = true;
    else if (args.mode != "key")
        throw GenError(ErrorKind::UnknownMode,
                       "unknown mode '" + args.mode + "' (must be key or uuid)");

    req.key.encoding = parse_format(args.format);
    if (args.preset)
        req.key.preset = preset::parse(*args.preset);
    if (args.length)
        req.key.length = preset::parse_length(*args.length);

    req.uuid.version = uuid::parse_version(args.uuid_version);
    if (args.ns)
        req.uuid.ns = uuid::parse_namespace(*args.ns);
    req.uuid.name = args.name;
    return req;
}

// ── Commands ──────────────────────────────────────────────────────────────────

static std::string cmd_key(const KeyRequest& req, bool yaml) {
    size_t length = preset::resolve_length(req.preset, req.length);
    std::vector<uint8_t> key = rng::random_bytes(length);
    std::string encoded = encode_key(key, req.encoding);

    if (!yaml)
        return encoded + "\n";

    KeyReport report;
    report.preset = req.preset ? &preset::info(*req.preset) : nullptr;
    report.format = req.encoding;
    report.bytes  = length;
    report.value  = encoded;
    return emit_key_yaml(report);
}

static std::string cmd_uuid(const UuidRequest& req, bool yaml) {
    std::string text = uuid::to_string(uuid::generate(req));

    if (!yaml)
        return text + "\n";

    UuidReport report;
    report.version = req.version;
    if (req.version == UuidVersion::V3 || req.version == UuidVersion::V5) {
        report.ns   = req.ns;
        report.name = req.name;
    }
    report.value = text;
    return emit_uuid_yaml(report);
}

// ── run ───────────────────────────────────────────────────────────────────────

int run(int argc, char** argv, std::ostream& out, std::ostream& err) {
    const char* prog = argc > 0 ? argv[0] : "genrs";
    const char* slash = std::strrchr(prog, '/');
    if (slash) prog = slash + 1;

    Args args;
    if (!parse_args(argc, argv, args, err)) {
        print_usage(err, prog);
        return EXIT_USAGE;
    }

    if (args.help) {
        print_usage(out, prog);
        return out.flush() ? EXIT_OK : EXIT_IO;
    }
    if (args.version) {
        out << "genrs " << GENRS_VERSION << "\n";
        return out.flush() ? EXIT_OK : EXIT_IO;
    }

    std::string result;
    try {
        Request req = build_request(args);
        result = req.uuid_mode ? cmd_uuid(req.uuid, args.yaml)
                               : cmd_key(req.key, args.yaml);
    } catch (const std::exception& e) {
        return report_error(e, err);
    }

    out << result;
    out.flush();
    if (!out) {
        err << "Error: failed to write output\n";
        return EXIT_IO;
    }
    return EXIT_OK;
}
