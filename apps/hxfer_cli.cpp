#include "hxfer/config.hpp"
#include "hxfer/digest.hpp"
#include "hxfer/log.hpp"
#include "hxfer/server.hpp"
#include "hxfer/session.hpp"
#include "hxfer/tls.hpp"
#include <csignal>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

static void usage() {
    std::cerr <<
"hxfer-cli\n"
"USAGE:\n"
"  hxfer-cli send <host> <port> <file> --peer-cert <pem> [--sign-key <pem>] [--insecure] [--config <file>]\n"
"  hxfer-cli serve <port> <out_dir> --cert <pem> --key <pem> [--verify-cert <pem>]\n"
"                  [--host <addr>] [--require-signature] [--config <file>]\n"
"  hxfer-cli digest <file>\n";
}

struct Args {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
    std::map<std::string, bool> flags;
};

static Args parse_args(int argc, char** argv, int first,
                       const std::vector<std::string>& with_value,
                       const std::vector<std::string>& switches) {
    Args a;
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) { a.positional.push_back(arg); continue; }
        bool known = false;
        for (const auto& o : with_value) {
            if (arg == o) {
                if (i + 1 >= argc) throw std::invalid_argument(arg + " needs a value");
                a.options[o] = argv[++i];
                known = true;
            }
        }
        for (const auto& s : switches) {
            if (arg == s) { a.flags[s] = true; known = true; }
        }
        if (!known) throw std::invalid_argument("unknown option " + arg);
    }
    return a;
}

static uint16_t parse_port(const std::string& s) {
    unsigned long v = std::stoul(s);
    if (v > 65535) throw std::invalid_argument("port out of range: " + s);
    return (uint16_t)v;
}

static hxfer::Config load_config(const Args& a) {
    auto it = a.options.find("--config");
    hxfer::Config cfg = it == a.options.end() ? hxfer::Config() : hxfer::Config::load_file(it->second);
    auto& log = hxfer::Logger::instance();
    log.setLevel(cfg.log_level());
    if (!cfg.log_file().empty()) log.setLogFile(cfg.log_file());
    return cfg;
}

static int cmd_send(const Args& a) {
    if (a.positional.size() != 3 || !a.options.count("--peer-cert")) { usage(); return 1; }
    const hxfer::Config cfg = load_config(a);
    const std::string& host = a.positional[0];
    const uint16_t port = parse_port(a.positional[1]);
    const std::string& file = a.positional[2];
    const std::string& peer_cert = a.options.at("--peer-cert");
    const bool insecure = a.flags.count("--insecure") != 0;

    // The receiver's certificate is both the TLS trust anchor and the wrapping key.
    hxfer::PublicKey receiver_key = hxfer::PublicKey::load_pem_file(peer_cert);
    std::unique_ptr<hxfer::PrivateKey> signing_key;
    if (a.options.count("--sign-key"))
        signing_key = std::make_unique<hxfer::PrivateKey>(hxfer::PrivateKey::load_pem_file(a.options.at("--sign-key")));

    auto tls = hxfer::TlsContext::client(peer_cert, insecure);
    auto channel = hxfer::tls_connect(host, port, tls, cfg.io_timeout_ms());
    hxfer::SenderSession session(*channel, receiver_key, signing_key.get(), cfg.session_options());
    session.set_label(host + ":" + std::to_string(port));
    auto report = session.send_file(file);
    std::cout << "OK " << report.name << " " << report.size << " " << hxfer::to_hex(report.digest) << "\n";
    return 0;
}

static int cmd_serve(const Args& a) {
    if (a.positional.size() != 2 || !a.options.count("--cert") || !a.options.count("--key")) { usage(); return 1; }
    const hxfer::Config cfg = load_config(a);

    hxfer::ServerConfig sc;
    sc.port = parse_port(a.positional[0]);
    sc.out_dir = a.positional[1];
    if (a.options.count("--host")) sc.host = a.options.at("--host");
    sc.options = cfg.session_options();
    if (a.flags.count("--require-signature")) sc.options.require_signature = true;
    sc.io_timeout_ms = cfg.io_timeout_ms();

    auto receiver_key = hxfer::PrivateKey::load_pem_file(a.options.at("--key"));
    std::unique_ptr<hxfer::PublicKey> sender_key;
    if (a.options.count("--verify-cert"))
        sender_key = std::make_unique<hxfer::PublicKey>(hxfer::PublicKey::load_pem_file(a.options.at("--verify-cert")));

    auto tls = hxfer::TlsContext::server(a.options.at("--cert"), a.options.at("--key"));
    hxfer::Server server(tls, receiver_key, sender_key.get(), sc);
    server.listen();
    server.serve();
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 1; }
    std::signal(SIGPIPE, SIG_IGN);
    std::string cmd = argv[1];

    try {
        if (cmd == "send") {
            return cmd_send(parse_args(argc, argv, 2, {"--peer-cert", "--sign-key", "--config"}, {"--insecure"}));
        } else if (cmd == "serve") {
            return cmd_serve(parse_args(argc, argv, 2, {"--cert", "--key", "--verify-cert", "--host", "--config"},
                                        {"--require-signature"}));
        } else if (cmd == "digest") {
            if (argc != 3) { usage(); return 1; }
            std::cout << hxfer::to_hex(hxfer::digest_file(argv[2])) << "\n";
        } else {
            usage();
            return 1;
        }
    } catch (const hxfer::TransferError& e) {
        std::cerr << "ERROR: " << hxfer::reason_name(e.reason()) << ": " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 2;
    }
    return 0;
}
