#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cctype>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <deque>
#include <fcntl.h>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <netdb.h>
#include <netinet/in.h>
#include <nlohmann/json.hpp>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/ssl.h>
#include <optional>
#include <poll.h>
#include <random>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <tuple>
#include <type_traits>
#include <unistd.h>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace cloudvars {

/// Marker the cloud service puts in front of every cloud variable name
/// (U+2601 CLOUD followed by a space).
constexpr std::string_view kCloudPrefix = "\xE2\x98\x81 ";

inline bool has_prefix(std::string_view name) {
  return name.substr(0, kCloudPrefix.size()) == kCloudPrefix;
}

/// Return `name` with the cloud prefix, adding it only when missing.
inline std::string with_prefix(std::string_view name) {
  if (has_prefix(name))
    return std::string(name);
  std::string out(kCloudPrefix);
  out.append(name);
  return out;
}

namespace detail {

inline bool is_blank(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' ||
         c == '\f';
}

inline int digit_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'z')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'Z')
    return c - 'A' + 10;
  return -1;
}

inline std::string lower(std::string text) {
  for (auto &c : text) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return text;
}

} // namespace detail

/// True when `text` reads as a number the way a JavaScript `Number(text)`
/// conversion would: surrounding whitespace is ignored, blank text counts as
/// zero, and decimal, exponent, `Infinity` and 0x/0o/0b forms are accepted.
inline bool is_numeric_string(std::string_view text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && detail::is_blank(text[begin]))
    ++begin;
  while (end > begin && detail::is_blank(text[end - 1]))
    --end;
  auto s = text.substr(begin, end - begin);
  if (s.empty())
    return true;

  if (s.size() > 2 && s[0] == '0') {
    char kind = static_cast<char>(std::tolower(static_cast<unsigned char>(s[1])));
    int base = kind == 'x' ? 16 : kind == 'o' ? 8 : kind == 'b' ? 2 : 0;
    if (base != 0) {
      for (size_t i = 2; i < s.size(); ++i) {
        int d = detail::digit_value(s[i]);
        if (d < 0 || d >= base)
          return false;
      }
      return true;
    }
  }

  size_t i = 0;
  if (s[i] == '+' || s[i] == '-')
    ++i;
  if (s.substr(i) == "Infinity")
    return true;

  bool digits = false;
  while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
    ++i;
    digits = true;
  }
  if (i < s.size() && s[i] == '.') {
    ++i;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
      ++i;
      digits = true;
    }
  }
  if (!digits)
    return false;

  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    ++i;
    if (i < s.size() && (s[i] == '+' || s[i] == '-'))
      ++i;
    bool exponent = false;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
      ++i;
      exponent = true;
    }
    if (!exponent)
      return false;
  }
  return i == s.size();
}

/// Textual form of a number as it is stored and sent.
inline std::string to_value_string(double value) {
  if (std::isnan(value))
    return "NaN";
  if (std::isinf(value))
    return value > 0 ? "Infinity" : "-Infinity";
  if (value == 0)
    return "0";
  if (value == std::floor(value) && std::fabs(value) < 1e21) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.0f", value);
    return buf;
  }
  return nlohmann::json(value).dump();
}

template <typename T>
std::enable_if_t<std::is_arithmetic_v<T>, std::string> to_value_string(T value) {
  if constexpr (std::is_same_v<T, bool>) {
    return value ? "true" : "false";
  } else if constexpr (std::is_integral_v<T>) {
    return std::to_string(value);
  } else {
    return to_value_string(static_cast<double>(value));
  }
}

// --- data model -----------------------------------------------------------

/// Account name plus the session id cookie produced by the login flow.
struct credential {
  std::string username;
  std::string session_id;
};

/// Project id of the room; kept with its original JSON type on the wire.
using room_id = std::variant<std::string, std::int64_t>;

inline nlohmann::json room_to_json(const room_id &room) {
  if (auto *number = std::get_if<std::int64_t>(&room))
    return *number;
  return std::get<std::string>(room);
}

inline std::string room_to_string(const room_id &room) {
  if (auto *number = std::get_if<std::int64_t>(&room))
    return std::to_string(*number);
  return std::get<std::string>(room);
}

/// One protocol record. `name` and `value` only exist on `set` packets.
struct packet {
  std::string method;
  std::string user;
  room_id project_id;
  std::optional<std::string> name;
  std::optional<std::string> value;
};

inline packet make_handshake_packet(const std::string &user,
                                    const room_id &room) {
  return {"handshake", user, room, std::nullopt, std::nullopt};
}

inline packet make_set_packet(const std::string &user, const room_id &room,
                              std::string name, std::string value) {
  return {"set", user, room, std::move(name), std::move(value)};
}

// --- packet codec ---------------------------------------------------------

/// Serialize one packet to a single newline-terminated JSON line.
inline std::string encode_packet(const packet &p) {
  nlohmann::json msg = {{"method", p.method},
                        {"user", p.user},
                        {"project_id", room_to_json(p.project_id)}};
  if (p.name)
    msg["name"] = *p.name;
  if (p.value)
    msg["value"] = *p.value;
  return msg.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) +
         "\n";
}

/// Parse one line. Returns nullopt for anything that is not a JSON object
/// carrying a string `method`.
inline std::optional<packet> decode_packet(std::string_view line) {
  nlohmann::json msg;
  try {
    msg = nlohmann::json::parse(line.begin(), line.end());
  } catch (const nlohmann::json::exception &) {
    return std::nullopt;
  }

  if (!msg.is_object() || !msg.contains("method") ||
      !msg["method"].is_string()) {
    return std::nullopt;
  }

  packet p;
  p.method = msg["method"].get<std::string>();
  if (msg.contains("user") && msg["user"].is_string())
    p.user = msg["user"].get<std::string>();
  if (msg.contains("project_id")) {
    const auto &id = msg["project_id"];
    if (id.is_number_integer())
      p.project_id = id.get<std::int64_t>();
    else if (id.is_string())
      p.project_id = id.get<std::string>();
  }
  if (msg.contains("name") && msg["name"].is_string())
    p.name = msg["name"].get<std::string>();
  if (msg.contains("value")) {
    const auto &value = msg["value"];
    if (value.is_string())
      p.value = value.get<std::string>();
    else if (value.is_number_float())
      p.value = to_value_string(value.get<double>());
    else if (value.is_number())
      p.value = value.dump();
  }
  return p;
}

/// Split an inbound frame on newlines and decode every non-empty segment.
/// Malformed segments are skipped; the rest of the frame is still returned.
inline std::vector<packet> decode_frame(std::string_view frame) {
  std::vector<packet> out;
  size_t start = 0;
  while (start < frame.size()) {
    size_t nl = frame.find('\n', start);
    size_t stop = nl == std::string_view::npos ? frame.size() : nl;
    auto segment = frame.substr(start, stop - start);
    start = stop + 1;
    if (segment.empty())
      continue;
    if (auto p = decode_packet(segment))
      out.push_back(std::move(*p));
  }
  return out;
}

// --- variable store -------------------------------------------------------

class variable_store {
public:
  struct apply_result {
    bool is_new = false;
  };

  apply_result apply(const std::string &name, std::string value) {
    auto [it, inserted] = values_.try_emplace(name, value);
    if (!inserted)
      it->second = std::move(value);
    return {inserted};
  }

  std::optional<std::string> get(const std::string &name) const {
    auto it = values_.find(name);
    if (it == values_.end())
      return std::nullopt;
    return it->second;
  }

  bool has(const std::string &name) const { return values_.count(name) > 0; }
  size_t size() const { return values_.size(); }
  bool empty() const { return values_.empty(); }

  std::unordered_map<std::string, std::string> snapshot() const {
    return values_;
  }

private:
  std::unordered_map<std::string, std::string> values_;
};

// --- outbound queue -------------------------------------------------------

class outbound_queue {
public:
  void enqueue(packet p) { packets_.push_back(std::move(p)); }

  /// Remove and return every queued packet, oldest first.
  std::vector<packet> drain() {
    std::vector<packet> out(std::make_move_iterator(packets_.begin()),
                            std::make_move_iterator(packets_.end()));
    packets_.clear();
    return out;
  }

  /// Put packets that could not be written back at the head, keeping their
  /// order ahead of anything queued since.
  void requeue_front(std::vector<packet> packets) {
    packets_.insert(packets_.begin(), std::make_move_iterator(packets.begin()),
                    std::make_move_iterator(packets.end()));
  }

  size_t size() const { return packets_.size(); }
  bool empty() const { return packets_.empty(); }

private:
  std::deque<packet> packets_;
};

// --- reconnect policy -----------------------------------------------------

struct reconnect_policy {
  int base_delay_ms = 1000;
  int max_exponent = 5;
  /// Give up once the attempt counter reaches this value. 0 retries forever.
  int max_attempts = 0;
};

/// Full-jitter exponential backoff: `unit * (2^min(attempts, max_exponent) -
/// 1) * base_delay_ms`, with `unit` drawn from [0, 1).
inline int compute_backoff_delay_ms(const reconnect_policy &policy,
                                    int attempts, double unit) {
  int exponent = std::clamp(attempts, 0, std::max(0, policy.max_exponent));
  double span = (std::pow(2.0, exponent) - 1.0) * policy.base_delay_ms;
  double delay = std::clamp(unit, 0.0, 1.0) * span;
  if (span > 0 && delay >= span)
    delay = std::nextafter(span, 0.0);
  return std::max(0, static_cast<int>(delay));
}

// --- endpoint configuration -----------------------------------------------

/// Parsed ws:// or wss:// URL.
struct parsed_uri {
  std::string raw;
  std::string scheme;
  std::string host;
  int port = 0;
  std::string path;
  bool secure = false;
};

/// Split `host[:port]` or `[v6-literal][:port]`. The brackets are stripped
/// from an IPv6 host; an unbracketed host may not contain ':'.
inline std::tuple<std::string, int> split_host_port(const std::string &addr,
                                                     int default_port) {
  std::string host;
  std::string port_text;
  if (!addr.empty() && addr.front() == '[') {
    auto close = addr.find(']');
    if (close == std::string::npos)
      throw std::invalid_argument("unterminated IPv6 literal: " + addr);
    host = addr.substr(1, close - 1);
    std::string tail = addr.substr(close + 1);
    if (!tail.empty()) {
      if (tail.front() != ':')
        throw std::invalid_argument("junk after IPv6 literal: " + addr);
      port_text = tail.substr(1);
    }
  } else {
    auto pos = addr.find(':');
    if (pos == std::string::npos)
      return {addr, default_port};
    host = addr.substr(0, pos);
    port_text = addr.substr(pos + 1);
    if (port_text.find(':') != std::string::npos)
      throw std::invalid_argument("IPv6 hosts must be bracketed: " + addr);
  }

  if (port_text.empty())
    return {host, default_port};
  if (port_text.find_first_not_of("0123456789") != std::string::npos)
    throw std::invalid_argument("invalid port: " + port_text);
  return {host, std::stoi(port_text)};
}

inline parsed_uri parse_uri(const std::string &uri) {
  bool secure = uri.rfind("wss://", 0) == 0;
  if (!secure && uri.rfind("ws://", 0) != 0)
    throw std::invalid_argument("cloud endpoint must be ws:// or wss://: " +
                                uri);

  std::string rest = uri.substr(secure ? 6 : 5);
  std::string path = "/";
  auto slash = rest.find('/');
  if (slash != std::string::npos) {
    path = rest.substr(slash);
    rest = rest.substr(0, slash);
  }

  int port = 0;
  std::string host;
  try {
    std::tie(host, port) = split_host_port(rest, secure ? 443 : 80);
  } catch (const std::logic_error &e) {
    throw std::invalid_argument("invalid cloud endpoint " + uri + ": " +
                                e.what());
  }
  if (host.empty() || port <= 0 || port > 65535)
    throw std::invalid_argument("invalid cloud endpoint: " + uri);

  return {uri, secure ? "wss" : "ws", host, port, path, secure};
}

/// How the session proves its identity when the socket is opened.
enum class credential_strategy {
  session_cookie, ///< send `Cookie: scratchsessionsid=...;`
  origin_only,    ///< no cookie; the server trusts the Origin header
};

struct endpoint_config {
  std::string url;
  std::string origin;
  credential_strategy credentials = credential_strategy::session_cookie;
  size_t max_value_length = 256;
  std::string user_agent = "cloudvars/1.0";
  bool verify_tls = true;

  static endpoint_config scratch() {
    endpoint_config cfg;
    cfg.url = "wss://clouddata.scratch.mit.edu/";
    cfg.origin = "https://scratch.mit.edu";
    cfg.credentials = credential_strategy::session_cookie;
    cfg.max_value_length = 256;
    return cfg;
  }

  static endpoint_config turbowarp() {
    endpoint_config cfg;
    cfg.url = "wss://clouddata.turbowarp.org/";
    cfg.origin = "turbowarp.org";
    cfg.credentials = credential_strategy::origin_only;
    cfg.max_value_length = 100000;
    return cfg;
  }

  static endpoint_config select(bool use_turbowarp) {
    return use_turbowarp ? turbowarp() : scratch();
  }
};

// --- transport ------------------------------------------------------------

class transport_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// `closed` is an orderly end (close frame or EOF); `failed` is a broken
/// connection whose reason is in last_error().
enum class read_status { message, timeout, closed, failed };

/// One live connection to the cloud server. Used by a single thread.
class transport {
public:
  virtual ~transport() = default;

  /// Connect and complete the upgrade. Throws transport_error.
  virtual void open() = 0;
  /// Wait up to `timeout_ms` for the next complete text message.
  virtual read_status read(std::string &text, int timeout_ms) = 0;
  /// Write one text message. Throws transport_error.
  virtual void send(const std::string &text) = 0;
  virtual void close() = 0;
  /// Why the last read returned read_status::failed.
  virtual std::string last_error() const { return {}; }
};

struct ws_frame {
  bool fin = true;
  uint8_t opcode = 0x1;
  std::string payload;
};

/// Build one RFC 6455 frame. Client frames must carry a mask.
inline std::string encode_ws_frame(uint8_t opcode, std::string_view payload,
                                   std::optional<std::array<uint8_t, 4>> mask,
                                   bool fin = true) {
  std::string frame;
  frame.reserve(payload.size() + 14);
  frame.push_back(static_cast<char>((fin ? 0x80 : 0x00) | (opcode & 0x0F)));

  uint8_t mask_bit = mask ? 0x80 : 0x00;
  uint64_t len = payload.size();
  if (len < 126) {
    frame.push_back(static_cast<char>(mask_bit | len));
  } else if (len <= 0xFFFF) {
    frame.push_back(static_cast<char>(mask_bit | 126));
    frame.push_back(static_cast<char>((len >> 8) & 0xFF));
    frame.push_back(static_cast<char>(len & 0xFF));
  } else {
    frame.push_back(static_cast<char>(mask_bit | 127));
    for (int i = 7; i >= 0; --i) {
      frame.push_back(static_cast<char>((len >> (i * 8)) & 0xFF));
    }
  }

  if (!mask) {
    frame.append(payload);
    return frame;
  }

  for (auto b : *mask)
    frame.push_back(static_cast<char>(b));
  for (size_t i = 0; i < payload.size(); ++i) {
    frame.push_back(
        static_cast<char>(static_cast<uint8_t>(payload[i]) ^ (*mask)[i % 4]));
  }
  return frame;
}

constexpr uint64_t kMaxFramePayload = 64ull * 1024 * 1024;

/// Decode the frame at the start of `buffer`. Returns the number of bytes
/// consumed, or 0 when the buffer does not yet hold a whole frame.
inline size_t decode_ws_frame(std::string_view buffer, ws_frame &out) {
  if (buffer.size() < 2)
    return 0;

  auto byte = [&buffer](size_t i) { return static_cast<uint8_t>(buffer[i]); };
  bool fin = (byte(0) & 0x80) != 0;
  uint8_t opcode = static_cast<uint8_t>(byte(0) & 0x0F);
  bool masked = (byte(1) & 0x80) != 0;
  uint64_t len = static_cast<uint64_t>(byte(1) & 0x7F);
  size_t pos = 2;

  if (len == 126) {
    if (buffer.size() < pos + 2)
      return 0;
    len = (static_cast<uint64_t>(byte(2)) << 8) | byte(3);
    pos += 2;
  } else if (len == 127) {
    if (buffer.size() < pos + 8)
      return 0;
    len = 0;
    for (int i = 0; i < 8; ++i) {
      len = (len << 8) | byte(pos + i);
    }
    pos += 8;
  }
  if (len > kMaxFramePayload)
    throw transport_error("websocket frame too large");

  std::array<uint8_t, 4> mask{};
  if (masked) {
    if (buffer.size() < pos + 4)
      return 0;
    for (size_t i = 0; i < 4; ++i)
      mask[i] = byte(pos + i);
    pos += 4;
  }

  if (buffer.size() - pos < len)
    return 0;

  out.fin = fin;
  out.opcode = opcode;
  out.payload.assign(buffer.substr(pos, static_cast<size_t>(len)));
  if (masked) {
    for (size_t i = 0; i < out.payload.size(); ++i) {
      out.payload[i] = static_cast<char>(out.payload[i] ^ mask[i % 4]);
    }
  }
  return pos + static_cast<size_t>(len);
}

inline std::string base64_encode(const unsigned char *data, size_t size) {
  // EVP_EncodeBlock writes a trailing NUL
  std::string out(4 * ((size + 2) / 3) + 1, '\0');
  int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()), data,
                          static_cast<int>(size));
  out.resize(n < 0 ? 0 : static_cast<size_t>(n));
  return out;
}

/// Expected Sec-WebSocket-Accept value for a Sec-WebSocket-Key.
inline std::string websocket_accept_key(const std::string &key) {
  std::string input = key + "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_Digest(input.data(), input.size(), digest, &digest_len, EVP_sha1(),
                 nullptr) != 1) {
    throw transport_error("sha1 digest failed");
  }
  return base64_encode(digest, digest_len);
}

/// HTTP upgrade request for `endpoint`. The session cookie is only sent when
/// the endpoint authenticates by cookie.
inline std::string build_upgrade_request(const endpoint_config &endpoint,
                                         const parsed_uri &uri,
                                         const std::string &session_id,
                                         const std::string &key) {
  std::ostringstream req;
  req << "GET " << uri.path << " HTTP/1.1\r\n";
  if (uri.host.find(':') != std::string::npos)
    req << "Host: [" << uri.host << "]";
  else
    req << "Host: " << uri.host;
  if (uri.port != (uri.secure ? 443 : 80))
    req << ":" << uri.port;
  req << "\r\n";
  req << "Upgrade: websocket\r\n";
  req << "Connection: Upgrade\r\n";
  req << "Sec-WebSocket-Key: " << key << "\r\n";
  req << "Sec-WebSocket-Version: 13\r\n";
  if (!endpoint.origin.empty())
    req << "Origin: " << endpoint.origin << "\r\n";
  if (endpoint.credentials == credential_strategy::session_cookie)
    req << "Cookie: scratchsessionsid=" << session_id << ";\r\n";
  if (!endpoint.user_agent.empty())
    req << "User-Agent: " << endpoint.user_agent << "\r\n";
  req << "\r\n";
  return req.str();
}

namespace detail {

inline int socket_bio_fd(BIO *bio) {
  auto value = reinterpret_cast<std::intptr_t>(BIO_get_data(bio));
  return static_cast<int>(value);
}

inline int socket_bio_write(BIO *bio, const char *data, int size) {
  BIO_clear_retry_flags(bio);
  ssize_t n = ::send(socket_bio_fd(bio), data, static_cast<size_t>(size),
                     MSG_NOSIGNAL);
  if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
    BIO_set_retry_write(bio);
  return static_cast<int>(n);
}

inline int socket_bio_read(BIO *bio, char *data, int size) {
  BIO_clear_retry_flags(bio);
  ssize_t n = ::recv(socket_bio_fd(bio), data, static_cast<size_t>(size), 0);
  if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
    BIO_set_retry_read(bio);
  return static_cast<int>(n);
}

inline long socket_bio_ctrl(BIO *bio, int cmd, long, void *ptr) {
  switch (cmd) {
  case BIO_CTRL_FLUSH:
    return 1;
  case BIO_C_GET_FD:
    if (ptr != nullptr)
      *static_cast<int *>(ptr) = socket_bio_fd(bio);
    return socket_bio_fd(bio);
  default:
    return 0;
  }
}

inline int socket_bio_create(BIO *bio) {
  BIO_set_data(bio, reinterpret_cast<void *>(std::intptr_t{-1}));
  BIO_set_init(bio, 1);
  return 1;
}

inline const BIO_METHOD *socket_bio_method() {
  static BIO_METHOD *method = [] {
    BIO_METHOD *m = BIO_meth_new(BIO_get_new_index() | BIO_TYPE_SOURCE_SINK |
                                     BIO_TYPE_DESCRIPTOR,
                                 "cloudvars socket");
    if (m != nullptr) {
      BIO_meth_set_write(m, socket_bio_write);
      BIO_meth_set_read(m, socket_bio_read);
      BIO_meth_set_ctrl(m, socket_bio_ctrl);
      BIO_meth_set_create(m, socket_bio_create);
    }
    return m;
  }();
  return method;
}

} // namespace detail

/// Socket BIO for TLS that sends with MSG_NOSIGNAL, so writing to a peer that
/// has gone away fails with EPIPE instead of raising SIGPIPE. Does not own
/// `fd`. Returns nullptr on allocation failure.
inline BIO *make_socket_bio(int fd) {
  const BIO_METHOD *method = detail::socket_bio_method();
  if (method == nullptr)
    return nullptr;
  BIO *bio = BIO_new(method);
  if (bio != nullptr) {
    auto value = static_cast<std::intptr_t>(fd);
    BIO_set_data(bio, reinterpret_cast<void *>(value));
  }
  return bio;
}

/// WebSocket client over a POSIX socket, with OpenSSL for wss://.
class websocket_transport : public transport {
public:
  websocket_transport(endpoint_config endpoint, std::string session_id,
                      int connect_timeout_ms = 10000)
      : endpoint_(std::move(endpoint)), session_id_(std::move(session_id)),
        connect_timeout_ms_(connect_timeout_ms) {}

  ~websocket_transport() override { close(); }

  websocket_transport(const websocket_transport &) = delete;
  websocket_transport &operator=(const websocket_transport &) = delete;

  void open() override {
    close();
    last_error_.clear();
    auto uri = parse_uri(endpoint_.url);
    fd_ = connect_socket(uri);

    try {
      if (uri.secure)
        start_tls(uri);

      unsigned char nonce[16];
      if (RAND_bytes(nonce, sizeof(nonce)) != 1)
        throw transport_error("cannot generate websocket key");
      std::string key = base64_encode(nonce, sizeof(nonce));

      auto req = build_upgrade_request(endpoint_, uri, session_id_, key);
      write_all(req.data(), req.size());
      read_upgrade_response(key);

      int flags = ::fcntl(fd_, F_GETFL, 0);
      if (flags < 0 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0)
        throw transport_error("cannot make socket non-blocking");
    } catch (const transport_error &) {
      release();
      throw;
    }

    open_ = true;
  }

  read_status read(std::string &text, int timeout_ms) override {
    if (!open_)
      return read_status::closed;

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(std::max(0, timeout_ms));
    while (true) {
      ws_frame frame;
      size_t used = 0;
      try {
        used = decode_ws_frame(rx_, frame);
      } catch (const transport_error &e) {
        return fail(e.what());
      }

      if (used > 0) {
        rx_.erase(0, used);
        switch (frame.opcode) {
        case 0x8: // close
          reply_close(frame.payload);
          release();
          return read_status::closed;
        case 0x9: // ping
          try {
            send_frame(0xA, frame.payload);
          } catch (const transport_error &e) {
            return fail(e.what());
          }
          continue;
        case 0xA: // pong
          continue;
        case 0x0: // continuation
        case 0x1: // text
        case 0x2: // binary; the payload is treated as text
          if (frame.opcode != 0x0)
            fragment_.clear();
          fragment_.append(frame.payload);
          if (frame.fin) {
            text.swap(fragment_);
            fragment_.clear();
            return read_status::message;
          }
          continue;
        default:
          continue;
        }
      }

      bool buffered = ssl_ && SSL_pending(ssl_.get()) > 0;
      if (!buffered) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                             deadline - std::chrono::steady_clock::now())
                             .count();
        if (remaining < 0)
          remaining = 0;
        pollfd pfd{fd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (rc == 0)
          return read_status::timeout;
        if (rc < 0) {
          if (errno == EINTR)
            continue;
          return fail(std::string("poll failed: ") + std::strerror(errno));
        }
      }

      char buf[16384];
      size_t got = 0;
      auto result = read_some(buf, sizeof(buf), got);
      if (result == io_result::closed) {
        release();
        return read_status::closed;
      }
      if (result == io_result::failed)
        return fail(read_error_);
      if (result == io_result::ok)
        rx_.append(buf, got);
      else if (std::chrono::steady_clock::now() >= deadline)
        return read_status::timeout;
    }
  }

  void send(const std::string &text) override {
    if (!open_)
      throw transport_error("websocket is not open");
    send_frame(0x1, text);
  }

  void close() override {
    if (open_) {
      // 1000: normal closure
      try {
        send_frame(0x8, std::string("\x03\xE8", 2));
      } catch (const transport_error &) {
        // peer is already gone
      }
    }
    release();
  }

  std::string last_error() const override { return last_error_; }

private:
  enum class io_result { ok, would_block, closed, failed };

  struct ssl_ctx_deleter {
    void operator()(SSL_CTX *ctx) const { SSL_CTX_free(ctx); }
  };
  struct ssl_deleter {
    void operator()(SSL *ssl) const { SSL_free(ssl); }
  };

  static std::string ssl_error_text() {
    unsigned long code = ERR_get_error();
    if (code == 0)
      return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
  }

  int connect_socket(const parsed_uri &uri) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *found = nullptr;
    auto port = std::to_string(uri.port);
    int rc = ::getaddrinfo(uri.host.c_str(), port.c_str(), &hints, &found);
    if (rc != 0) {
      throw transport_error("cannot resolve " + uri.host + ": " +
                            ::gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(found,
                                                               &::freeaddrinfo);

    timeval tv{};
    tv.tv_sec = connect_timeout_ms_ / 1000;
    tv.tv_usec = (connect_timeout_ms_ % 1000) * 1000;

    std::string last_error = "no addresses";
    for (auto *ai = found; ai != nullptr; ai = ai->ai_next) {
      int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
      if (fd < 0) {
        last_error = std::strerror(errno);
        continue;
      }
      if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
          ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        last_error = std::strerror(errno);
        ::close(fd);
        continue;
      }
      if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0)
        return fd;
      last_error = std::strerror(errno);
      ::close(fd);
    }
    throw transport_error("cannot connect to " + uri.host + ":" + port + ": " +
                          last_error);
  }

  void start_tls(const parsed_uri &uri) {
    ctx_.reset(SSL_CTX_new(TLS_client_method()));
    if (!ctx_)
      throw transport_error("cannot create TLS context: " + ssl_error_text());
    SSL_CTX_set_mode(ctx_.get(), SSL_MODE_ENABLE_PARTIAL_WRITE |
                                     SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
    if (endpoint_.verify_tls) {
      SSL_CTX_set_verify(ctx_.get(), SSL_VERIFY_PEER, nullptr);
      if (SSL_CTX_set_default_verify_paths(ctx_.get()) != 1)
        throw transport_error("cannot load CA certificates: " +
                              ssl_error_text());
    }

    ssl_.reset(SSL_new(ctx_.get()));
    if (!ssl_)
      throw transport_error("cannot create TLS session: " + ssl_error_text());
    SSL_set_tlsext_host_name(ssl_.get(), uri.host.c_str());
    if (endpoint_.verify_tls && SSL_set1_host(ssl_.get(), uri.host.c_str()) != 1)
      throw transport_error("cannot set TLS host name: " + ssl_error_text());
    BIO *bio = make_socket_bio(fd_);
    if (bio == nullptr)
      throw transport_error("cannot create TLS socket: " + ssl_error_text());
    SSL_set_bio(ssl_.get(), bio, bio);
    if (SSL_connect(ssl_.get()) != 1)
      throw transport_error("TLS handshake with " + uri.host +
                            " failed: " + ssl_error_text());
  }

  void read_upgrade_response(const std::string &key) {
    std::string headers;
    headers.reserve(1024);
    while (headers.find("\r\n\r\n") == std::string::npos) {
      char ch = 0;
      size_t got = 0;
      if (read_some(&ch, 1, got) != io_result::ok)
        throw transport_error("websocket upgrade failed: connection closed");
      headers.push_back(ch);
      if (headers.size() > 16384)
        throw transport_error("websocket handshake too large");
    }

    auto status_end = headers.find("\r\n");
    auto status_line = headers.substr(0, status_end);
    if (status_line.find(" 101") == std::string::npos)
      throw transport_error("websocket upgrade rejected: " + status_line);

    std::string lower = detail::lower(headers);
    const std::string field = "\r\nsec-websocket-accept:";
    auto pos = lower.find(field);
    if (pos == std::string::npos)
      throw transport_error("websocket upgrade missing Sec-WebSocket-Accept");
    pos += field.size();
    auto end = headers.find("\r\n", pos);
    std::string accept = headers.substr(pos, end - pos);
    accept.erase(0, accept.find_first_not_of(" \t"));
    accept.erase(accept.find_last_not_of(" \t") + 1);
    if (accept != websocket_accept_key(key))
      throw transport_error("websocket upgrade returned a bad accept key");
  }

  io_result read_some(char *buf, size_t cap, size_t &got) {
    got = 0;
    if (ssl_) {
      errno = 0;
      int n = SSL_read(ssl_.get(), buf, static_cast<int>(cap));
      if (n > 0) {
        got = static_cast<size_t>(n);
        return io_result::ok;
      }
      int err = SSL_get_error(ssl_.get(), n);
      if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
        return io_result::would_block;
      if (err == SSL_ERROR_ZERO_RETURN)
        return io_result::closed;
      if (err == SSL_ERROR_SYSCALL && errno != 0) {
        read_error_ = std::string("websocket read failed: ") +
                      std::strerror(errno);
        return io_result::failed;
      }
      read_error_ = "TLS read failed: " + ssl_error_text();
      return io_result::failed;
    }

    ssize_t n = ::recv(fd_, buf, cap, 0);
    if (n > 0) {
      got = static_cast<size_t>(n);
      return io_result::ok;
    }
    if (n == 0)
      return io_result::closed;
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
      return io_result::would_block;
    read_error_ = std::string("websocket read failed: ") + std::strerror(errno);
    return io_result::failed;
  }

  read_status fail(std::string reason) {
    last_error_ = std::move(reason);
    release();
    return read_status::failed;
  }

  void wait_writable(short events) {
    pollfd pfd{fd_, events, 0};
    int rc = ::poll(&pfd, 1, connect_timeout_ms_);
    if (rc == 0)
      throw transport_error("websocket send timed out");
    if (rc < 0 && errno != EINTR)
      throw transport_error(std::string("poll failed: ") + std::strerror(errno));
  }

  void write_all(const char *data, size_t size) {
    size_t sent = 0;
    while (sent < size) {
      if (fd_ < 0)
        throw transport_error("websocket is closed");
      if (ssl_) {
        int n = SSL_write(ssl_.get(), data + sent,
                          static_cast<int>(size - sent));
        if (n > 0) {
          sent += static_cast<size_t>(n);
          continue;
        }
        int err = SSL_get_error(ssl_.get(), n);
        if (err == SSL_ERROR_WANT_WRITE) {
          wait_writable(POLLOUT);
          continue;
        }
        if (err == SSL_ERROR_WANT_READ) {
          wait_writable(POLLIN);
          continue;
        }
        throw transport_error("TLS write failed: " + ssl_error_text());
      }

      ssize_t n = ::send(fd_, data + sent, size - sent, MSG_NOSIGNAL);
      if (n > 0) {
        sent += static_cast<size_t>(n);
        continue;
      }
      if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        wait_writable(POLLOUT);
        continue;
      }
      if (n < 0 && errno == EINTR)
        continue;
      throw transport_error(std::string("websocket send failed: ") +
                            std::strerror(errno));
    }
  }

  void send_frame(uint8_t opcode, const std::string &payload) {
    std::array<uint8_t, 4> mask{};
    for (auto &b : mask) {
      b = static_cast<uint8_t>(random_device_());
    }
    auto frame = encode_ws_frame(opcode, payload, mask);
    write_all(frame.data(), frame.size());
  }

  void reply_close(const std::string &payload) {
    try {
      send_frame(0x8, payload.substr(0, 2));
    } catch (const transport_error &) {
      // peer is already gone
    }
  }

  void release() {
    open_ = false;
    if (ssl_) {
      SSL_shutdown(ssl_.get());
      ssl_.reset();
    }
    ctx_.reset();
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
    rx_.clear();
    fragment_.clear();
  }

  endpoint_config endpoint_;
  std::string session_id_;
  int connect_timeout_ms_;

  int fd_ = -1;
  bool open_ = false;
  std::unique_ptr<SSL_CTX, ssl_ctx_deleter> ctx_;
  std::unique_ptr<SSL, ssl_deleter> ssl_;
  std::string rx_;
  std::string fragment_;
  std::string read_error_;
  std::string last_error_;
  std::random_device random_device_;
};

// --- events ---------------------------------------------------------------

enum class event_kind { open, close, error, setup, set, add_variable };

inline const char *to_string(event_kind kind) {
  switch (kind) {
  case event_kind::open:
    return "open";
  case event_kind::close:
    return "close";
  case event_kind::error:
    return "error";
  case event_kind::setup:
    return "setup";
  case event_kind::set:
    return "set";
  case event_kind::add_variable:
    return "addvariable";
  }
  return "unknown";
}

struct variable_change {
  std::string name;
  std::string value;
};

struct session_error {
  std::string message;
};

struct event {
  event_kind kind;
  std::variant<std::monostate, variable_change, session_error> payload;

  const variable_change *change() const {
    return std::get_if<variable_change>(&payload);
  }
  const session_error *error() const {
    return std::get_if<session_error>(&payload);
  }
};

using listener_id = std::uint64_t;
using listener_fn = std::function<void(const event &)>;

// --- session --------------------------------------------------------------

using transport_factory_fn = std::function<std::unique_ptr<transport>(
    const endpoint_config &, const credential &)>;

struct session_options {
  reconnect_policy reconnect;
  /// Longest the io loop blocks in a read before flushing writes and
  /// checking for shutdown.
  int poll_interval_ms = 50;
  int connect_timeout_ms = 10000;
  std::shared_ptr<spdlog::logger> logger;
  /// Replaces the default websocket_transport.
  transport_factory_fn transport_factory;
};

namespace detail {

/// Everything a session shares with its io thread. The thread holds its own
/// reference, so the core outlives a session destroyed by one of its
/// listeners. Each `start()` gets a fresh run id; a loop keeps going only
/// while its id is the active one.
class session_core : public std::enable_shared_from_this<session_core> {
public:
  session_core(credential creds, room_id room, endpoint_config endpoint,
               session_options options)
      : creds_(std::move(creds)), room_(std::move(room)),
        endpoint_(std::move(endpoint)), options_(std::move(options)) {
    log_ = options_.logger ? options_.logger : spdlog::default_logger();
    if (!options_.transport_factory) {
      int timeout = options_.connect_timeout_ms;
      options_.transport_factory = [timeout](const endpoint_config &endpoint,
                                             const credential &creds) {
        return std::make_unique<websocket_transport>(endpoint,
                                                     creds.session_id, timeout);
      };
    }
  }

  bool running() const { return run_.load() != 0; }

  /// Make `run` the active run and start its io loop in `thread`. The loop
  /// does not begin until `thread` has been assigned.
  void launch(std::uint64_t run, std::thread &thread) {
    std::lock_guard<std::mutex> lock(state_mu_);
    run_.store(run);
    auto self = shared_from_this();
    thread = std::thread([self, run]() { self->io_loop(run); });
  }

  void stop() {
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      run_.store(0);
    }
    wake_cv_.notify_all();
  }

  bool set(std::string_view name, std::string_view value) {
    std::lock_guard<std::mutex> lock(state_mu_);
    std::string key = qualify(name);
    if (!is_numeric_string(value)) {
      log_->warn("rejected value for {}: cloud variables can only contain "
                 "numbers",
                 key);
      return false;
    }
    if (value.size() > endpoint_.max_value_length) {
      log_->warn("rejected value for {}: {} characters exceeds the maximum "
                 "of {}",
                 key, value.size(), endpoint_.max_value_length);
      return false;
    }

    std::string text(value);
    queued_.enqueue(make_set_packet(creds_.username, room_, key, text));
    variables_.apply(key, std::move(text));
    return true;
  }

  std::optional<std::string> get(std::string_view name) const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return variables_.get(qualify(name));
  }

  void set_auto_prefix(bool enabled) {
    std::lock_guard<std::mutex> lock(state_mu_);
    auto_prefix_ = enabled;
  }

  bool auto_prefix() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return auto_prefix_;
  }

  listener_id add_listener(event_kind kind, listener_fn fn, bool once) {
    if (!fn)
      throw std::invalid_argument("listener is required");
    std::lock_guard<std::mutex> lock(listeners_mu_);
    auto id = ++next_listener_;
    listeners_.push_back({id, kind, std::move(fn), once});
    return id;
  }

  bool remove_listener(listener_id id) {
    std::lock_guard<std::mutex> lock(listeners_mu_);
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
                           [id](const listener &l) { return l.id == id; });
    if (it == listeners_.end())
      return false;
    listeners_.erase(it);
    return true;
  }

  bool is_open() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return open_run_ != 0;
  }

  int attempts() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return attempts_;
  }

  size_t queued() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return queued_.size();
  }

  std::unordered_map<std::string, std::string> variables() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return variables_.snapshot();
  }

  const credential &creds() const { return creds_; }
  const room_id &room() const { return room_; }
  const endpoint_config &endpoint() const { return endpoint_; }

private:
  void io_loop(std::uint64_t run) {
    { std::lock_guard<std::mutex> lock(state_mu_); }
    while (active(run)) {
      auto conn = options_.transport_factory(endpoint_, creds_);
      try {
        conn->open();
      } catch (const transport_error &e) {
        log_->error("cannot connect to {}: {}", endpoint_.url, e.what());
        emit_error(e.what());
        emit(event_kind::close);
        if (!schedule_reconnect(run))
          return;
        continue;
      }

      run_epoch(*conn, run);
      conn->close();
      {
        std::lock_guard<std::mutex> lock(state_mu_);
        if (open_run_ == run)
          open_run_ = 0;
      }
      log_->info("cloud connection to {} closed", endpoint_.url);
      emit(event_kind::close);

      if (!active(run))
        return;
      if (!schedule_reconnect(run))
        return;
    }
  }

  struct listener {
    listener_id id;
    event_kind kind;
    listener_fn fn;
    bool once;
  };

  bool active(std::uint64_t run) const { return run_.load() == run; }

  std::string qualify(std::string_view name) const {
    if (auto_prefix_)
      return with_prefix(name);
    return std::string(name);
  }

  void emit(event ev) {
    std::vector<listener_fn> targets;
    {
      std::lock_guard<std::mutex> lock(listeners_mu_);
      for (auto it = listeners_.begin(); it != listeners_.end();) {
        if (it->kind != ev.kind) {
          ++it;
          continue;
        }
        targets.push_back(it->fn);
        it = it->once ? listeners_.erase(it) : std::next(it);
      }
    }

    for (auto &fn : targets) {
      try {
        fn(ev);
      } catch (const std::exception &e) {
        log_->error("{} listener threw: {}", to_string(ev.kind), e.what());
      }
    }
  }

  void emit(event_kind kind) { emit(event{kind, std::monostate{}}); }

  void emit_error(const std::string &message) {
    emit(event{event_kind::error, session_error{message}});
  }

  void run_epoch(transport &conn, std::uint64_t run) {
    std::vector<packet> backlog;
    backlog.push_back(make_handshake_packet(creds_.username, room_));
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      attempts_ = 1;
      open_run_ = run;
      auto queued = queued_.drain();
      backlog.insert(backlog.end(), std::make_move_iterator(queued.begin()),
                     std::make_move_iterator(queued.end()));
    }
    log_->info("cloud connection to {} open for project {}", endpoint_.url,
               room_to_string(room_));

    if (!write_packets(conn, std::move(backlog)))
      return;
    emit(event_kind::open);

    while (active(run)) {
      std::vector<packet> pending;
      {
        std::lock_guard<std::mutex> lock(state_mu_);
        pending = queued_.drain();
      }
      if (!write_packets(conn, std::move(pending)))
        return;

      std::string frame;
      auto status = conn.read(frame, options_.poll_interval_ms);
      if (status == read_status::closed)
        return;
      if (status == read_status::failed) {
        auto reason = conn.last_error();
        if (reason.empty())
          reason = "connection lost";
        log_->error("cloud connection to {} failed: {}", endpoint_.url, reason);
        emit_error(reason);
        return;
      }
      if (status == read_status::message)
        handle_frame(frame);
    }
  }

  bool write_packets(transport &conn, std::vector<packet> packets) {
    for (size_t i = 0; i < packets.size(); ++i) {
      try {
        conn.send(encode_packet(packets[i]));
      } catch (const transport_error &e) {
        log_->error("cloud send failed: {}", e.what());
        std::vector<packet> unsent;
        for (size_t j = i; j < packets.size(); ++j) {
          if (packets[j].method == "set")
            unsent.push_back(std::move(packets[j]));
        }
        {
          std::lock_guard<std::mutex> lock(state_mu_);
          queued_.requeue_front(std::move(unsent));
        }
        emit_error(e.what());
        return false;
      }
    }
    return true;
  }

  void handle_frame(const std::string &frame) {
    std::vector<event> events;
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      bool initial =
          frame.size() > 2 && variables_.empty() && !setup_emitted_;
      auto packets = decode_frame(frame);
      if (packets.empty())
        log_->debug("dropped cloud frame without packets: {}", frame);

      for (auto &p : packets) {
        if (p.method != "set" || !p.name || !p.value)
          continue;
        auto result = variables_.apply(*p.name, *p.value);
        events.push_back(
            event{result.is_new ? event_kind::add_variable : event_kind::set,
                  variable_change{*p.name, *p.value}});
      }
      if (initial) {
        setup_emitted_ = true;
        events.push_back(event{event_kind::setup, std::monostate{}});
      }
    }

    for (auto &ev : events)
      emit(std::move(ev));
  }

  /// Wait out the backoff delay. Returns false when the loop should stop.
  bool schedule_reconnect(std::uint64_t run) {
    std::unique_lock<std::mutex> lock(state_mu_);
    const auto &policy = options_.reconnect;
    if (policy.max_attempts > 0 && attempts_ >= policy.max_attempts) {
      auto expected = run;
      run_.compare_exchange_strong(expected, 0);
      lock.unlock();
      log_->error("giving up on {} after {} attempts", endpoint_.url,
                  policy.max_attempts);
      emit_error("reconnect attempts exhausted");
      return false;
    }

    double unit = std::uniform_real_distribution<double>(0.0, 1.0)(rng_);
    int delay = compute_backoff_delay_ms(policy, attempts_, unit);
    if (attempts_ < std::numeric_limits<int>::max())
      ++attempts_;
    log_->debug("reconnecting to {} in {} ms (attempt {})", endpoint_.url,
                delay, attempts_);

    wake_cv_.wait_for(lock, std::chrono::milliseconds(delay),
                      [this, run]() { return !active(run); });
    return active(run);
  }

  credential creds_;
  room_id room_;
  endpoint_config endpoint_;
  session_options options_;
  std::shared_ptr<spdlog::logger> log_;

  mutable std::mutex state_mu_;
  std::condition_variable wake_cv_;
  variable_store variables_;
  outbound_queue queued_;
  std::uint64_t open_run_ = 0;
  bool setup_emitted_ = false;
  bool auto_prefix_ = true;
  int attempts_ = 0;
  std::mt19937 rng_{std::random_device{}()};

  /// 0 while stopped.
  std::atomic<std::uint64_t> run_{0};

  std::mutex listeners_mu_;
  std::vector<listener> listeners_;
  listener_id next_listener_ = 0;
};

} // namespace detail

/// A connection to one room's cloud variables.
///
/// `set` updates the local store immediately and queues the write; the io
/// loop started by `start()` sends it once a connection is open, reconnecting
/// with jittered exponential backoff until `close()`. Event listeners run on
/// the io thread. A listener may close or destroy the session; the io loop
/// then winds down on its own instead of being joined.
class session {
public:
  session(credential creds, room_id room,
          endpoint_config endpoint = endpoint_config::scratch(),
          session_options options = {}) {
    if (creds.username.empty())
      throw std::invalid_argument("username is required");
    (void)parse_uri(endpoint.url);
    core_ = std::make_shared<detail::session_core>(
        std::move(creds), std::move(room), std::move(endpoint),
        std::move(options));
  }

  ~session() { close(); }

  session(const session &) = delete;
  session &operator=(const session &) = delete;

  /// Start the io loop. Does nothing while it is already running.
  void start() {
    if (core_->running())
      return;
    if (io_thread_.joinable()) {
      if (io_thread_.get_id() == std::this_thread::get_id())
        io_thread_.detach();
      else
        io_thread_.join();
    }
    core_->launch(++next_run_, io_thread_);
  }

  /// Stop reconnecting, close the live transport and join the io loop.
  /// Called from a listener, the loop is detached and stops after the
  /// listener returns.
  void close() {
    core_->stop();
    if (!io_thread_.joinable())
      return;
    if (io_thread_.get_id() == std::this_thread::get_id())
      io_thread_.detach();
    else
      io_thread_.join();
  }

  /// Set a cloud variable. The value must read as a number and fit the
  /// endpoint's length limit; otherwise a warning is logged and nothing is
  /// stored or sent.
  bool set(std::string_view name, std::string_view value) {
    return core_->set(name, value);
  }

  template <typename T,
            typename = std::enable_if_t<std::is_arithmetic_v<T>>>
  bool set(std::string_view name, T value) {
    auto text = to_value_string(value);
    return set(name, std::string_view(text));
  }

  std::optional<std::string> get(std::string_view name) const {
    return core_->get(name);
  }

  void enable_auto_prefix() { core_->set_auto_prefix(true); }
  void disable_auto_prefix() { core_->set_auto_prefix(false); }
  bool auto_prefix() const { return core_->auto_prefix(); }

  listener_id on(event_kind kind, listener_fn fn) {
    return core_->add_listener(kind, std::move(fn), false);
  }

  /// Like `on`, but the listener is removed before its first call.
  listener_id once(event_kind kind, listener_fn fn) {
    return core_->add_listener(kind, std::move(fn), true);
  }

  bool off(listener_id id) { return core_->remove_listener(id); }

  bool is_open() const { return core_->is_open(); }
  int attempts() const { return core_->attempts(); }

  /// Packets written by `set` that have not reached a transport yet.
  size_t queued() const { return core_->queued(); }

  std::unordered_map<std::string, std::string> variables() const {
    return core_->variables();
  }

  const endpoint_config &endpoint() const { return core_->endpoint(); }
  const room_id &room() const { return core_->room(); }
  const std::string &user() const { return core_->creds().username; }

private:
  std::shared_ptr<detail::session_core> core_;
  std::thread io_thread_;
  std::uint64_t next_run_ = 0;
};

/// Session against the default host, or the TurboWarp host when
/// `turbowarp` is set.
inline std::unique_ptr<session> make_session(credential creds, room_id room,
                                             bool turbowarp = false,
                                             session_options options = {}) {
  return std::make_unique<session>(std::move(creds), std::move(room),
                                   endpoint_config::select(turbowarp),
                                   std::move(options));
}

} // namespace cloudvars
