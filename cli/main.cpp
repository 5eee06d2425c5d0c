/**
 * @file main.cpp
 * @brief coapwire-cli: Linux one-shot inspector around the coapwire codec.
 *
 * Subcommands:
 *  - decode <hex>     : decode one datagram, print a key=value line (or JSON with --format json).
 *  - encode ...       : build a message from flags, print the datagram as hex.
 *  - blocks <hex>     : split a datagram's payload into blocks, one hex datagram per line.
 *                       --szx wins over default_block_size_exponent from --config.
 *  - params           : print transmission parameters (defaults, or overridden by --config).
 *
 * Notes:
 *  - Success goes to stdout, failures go to stderr as "status=error reason=<name>".
 *  - Exit codes: 0 ok, 1 command-line error (CLI11), 2 codec or input error.
 *  - --config takes a JSON object whose keys match the base parameter names, e.g.
 *    {"ack_timeout": 3.0, "max_retransmit": 6}. Unknown keys are rejected.
 */

#include <cstdint>
#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <iostream>

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "coapwire/blockwise.hpp"
#include "coapwire/config.hpp"
#include "coapwire/describe.hpp"
#include "coapwire/message.hpp"
#include "message_json.hpp"
#include "params_json.hpp"

using namespace coapwire;

// ---------- small utilities ----------

static int fail(const std::string& reason) {
  std::cerr << "status=error reason=" << reason << "\n";
  return 2;
}

static int fail(Status s) {
  std::cerr << describe_status(s) << "\n";
  return 2;
}

static Status decode_hex(const std::string& hex, Message& m, bool& bad_hex) {
  std::vector<uint8_t> bytes;
  bad_hex = !parse_hex(hex, bytes);
  if (bad_hex) return Status::MalformedMessage;
  return m.decode(bytes.data(), bytes.size());
}

// ---------- subcommands ----------

static int run_decode(const std::string& hex, const std::string& format) {
  Message m;
  bool bad_hex = false;
  const Status st = decode_hex(hex, m, bad_hex);
  if (bad_hex) return fail("bad_hex");
  if (st != Status::Ok) return fail(st);

  if (format == "json") std::cout << cli::message_to_json(m).dump(2) << "\n";
  else                  std::cout << describe(m) << "\n";
  return 0;
}

struct EncodeArgs {
  std::string type{"CON"};
  std::string code{"GET"};
  uint16_t    mid{0};
  std::string token;
  std::vector<std::string> path;
  std::vector<std::string> query;
  int         content_format{-1};
  std::string payload;
};

static int run_encode(const EncodeArgs& a) {
  Message m;
  MessageType t = MessageType::Confirmable;
  uint8_t c = 0;
  if (!cli::parse_type(a.type, t)) return fail("bad_type");
  if (!cli::parse_code(a.code, c)) return fail("bad_code");
  m.set_type(t);
  m.set_code(c);
  m.set_message_id(a.mid);

  std::vector<uint8_t> tok;
  if (!parse_hex(a.token, tok)) return fail("bad_hex");
  Status st = m.set_token(tok.data(), tok.size());
  if (st != Status::Ok) return fail(st);

  if (!a.path.empty()) {
    std::vector<const char*> segs;
    for (const auto& s : a.path) segs.push_back(s.c_str());
    st = m.options().set_uri_path(segs.data(), segs.size());
    if (st != Status::Ok) return fail(st);
  }
  if (!a.query.empty()) {
    std::vector<const char*> segs;
    for (const auto& s : a.query) segs.push_back(s.c_str());
    st = m.options().set_uri_query(segs.data(), segs.size());
    if (st != Status::Ok) return fail(st);
  }
  if (a.content_format >= 0) {
    st = m.options().set_content_format(etl::optional<uint32_t>(static_cast<uint32_t>(a.content_format)));
    if (st != Status::Ok) return fail(st);
  }
  st = m.set_payload(a.payload.c_str());
  if (st != Status::Ok) return fail(st);

  std::vector<uint8_t> buf(CW_DATAGRAM_MAX);
  size_t n = 0;
  st = m.encode(buf.data(), buf.size(), n);
  if (st != Status::Ok) return fail(st);
  std::cout << hex_string(buf.data(), n) << "\n";
  return 0;
}

static int run_blocks(const std::string& hex, uint8_t szx, uint16_t mid_base) {
  Message m;
  bool bad_hex = false;
  Status st = decode_hex(hex, m, bad_hex);
  if (bad_hex) return fail("bad_hex");
  if (st != Status::Ok) return fail(st);

  std::vector<uint8_t> buf(CW_DATAGRAM_MAX);
  Message block;
  for (uint32_t n = 0;; ++n) {
    st = extract_block(m, n, szx, block);
    if (st == Status::NoBlock) break;
    if (st != Status::Ok) return fail(st);

    block.set_message_id(static_cast<uint16_t>(mid_base + n));
    size_t len = 0;
    st = block.encode(buf.data(), buf.size(), len);
    if (st != Status::Ok) return fail(st);
    std::cout << hex_string(buf.data(), len) << "\n";
  }
  return 0;
}

// Defaults, overridden by the --config file when one is given.
static bool load_params(const std::string& config_path, TransmissionParams& p, std::string& reason) {
  if (config_path.empty()) return true;
  std::ifstream in(config_path);
  if (!in) { reason = "config_unreadable"; return false; }
  std::stringstream text;
  text << in.rdbuf();
  return cli::params_from_json(text.str(), p, reason);
}

static int run_params(const std::string& config_path) {
  TransmissionParams p;
  std::string reason;
  if (!load_params(config_path, p, reason)) return fail(reason);
  std::cout << cli::params_to_json(p).dump(2) << "\n";
  return 0;
}

// ---------- main ----------

int main(int argc, char** argv) {
  CLI::App app{"coapwire CLI: CoAP datagram inspector"};
  app.require_subcommand(1);

  // decode
  std::string dec_hex;
  std::string dec_format = "pretty";
  CLI::App* dec = app.add_subcommand("decode", "Decode a datagram given as hex");
  dec->add_option("hex", dec_hex, "Datagram bytes as hex")->required();
  dec->add_option("--format", dec_format, "Output format: pretty|json")
     ->check(CLI::IsMember({"pretty", "json"}));

  // encode
  EncodeArgs enc_args;
  CLI::App* enc = app.add_subcommand("encode", "Build a datagram and print it as hex");
  enc->add_option("--type", enc_args.type, "CON|NON|ACK|RST")
     ->check(CLI::IsMember({"CON", "NON", "ACK", "RST"}))->capture_default_str();
  enc->add_option("--code", enc_args.code, "GET|POST|PUT|DELETE, c.dd or a number")->capture_default_str();
  enc->add_option("--mid", enc_args.mid, "Message ID")->required();
  enc->add_option("--token", enc_args.token, "Token as hex (0..8 bytes)");
  enc->add_option("--path", enc_args.path, "Uri-Path segment (repeatable)");
  enc->add_option("--query", enc_args.query, "Uri-Query segment (repeatable)");
  enc->add_option("--content-format", enc_args.content_format, "Content-Format number")
     ->check(CLI::Range(0, 65535));
  enc->add_option("--payload", enc_args.payload, "Payload text");

  // blocks
  std::string blk_hex;
  unsigned blk_szx = DEFAULT_BLOCK_SIZE_EXPONENT;
  uint16_t blk_mid_base = 1;
  std::string blk_cfg_path;
  CLI::App* blk = app.add_subcommand("blocks", "Split a datagram's payload into blocks");
  blk->add_option("hex", blk_hex, "Datagram bytes as hex")->required();
  CLI::Option* blk_szx_opt =
      blk->add_option("--szx", blk_szx, "Block size exponent 0..7 (size = 2^(szx+4))")
         ->check(CLI::Range(0u, 7u))->capture_default_str();
  blk->add_option("--mid-base", blk_mid_base, "Message ID of the first block")->capture_default_str();
  blk->add_option("--config", blk_cfg_path, "JSON parameter file; its default_block_size_exponent applies without --szx")
     ->check(CLI::ExistingFile);

  // params
  std::string cfg_path;
  CLI::App* prm = app.add_subcommand("params", "Print transmission parameters as JSON");
  prm->add_option("--config", cfg_path, "JSON file overriding base parameters")
     ->check(CLI::ExistingFile);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  if (dec->parsed()) return run_decode(dec_hex, dec_format);
  if (enc->parsed()) return run_encode(enc_args);
  if (blk->parsed()) {
    if (blk_szx_opt->count() == 0) {
      TransmissionParams p;
      std::string reason;
      if (!load_params(blk_cfg_path, p, reason)) return fail(reason);
      blk_szx = p.default_block_size_exponent;
    }
    return run_blocks(blk_hex, static_cast<uint8_t>(blk_szx), blk_mid_base);
  }
  if (prm->parsed()) return run_params(cfg_path);
  return 0;
}
