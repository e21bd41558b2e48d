#include "pipeline/persister.hpp"
#include "util/errors.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

json encode_side(const std::vector<std::pair<double,double>>& rows) {
    json arr = json::array();
    for (const auto& [px, sz] : rows) {
        arr.push_back(json::array({px, sz}));
    }
    return arr;
}

std::vector<std::pair<double,double>> decode_side(const json& arr) {
    std::vector<std::pair<double,double>> rows;
    rows.reserve(arr.size());
    for (const auto& lvl : arr) {
        if (!lvl.is_array() || lvl.size() != 2) {
            throw PersistenceError("snapshot level is not a [price, size] pair");
        }
        rows.emplace_back(lvl.at(0).get<double>(), lvl.at(1).get<double>());
    }
    return rows;
}

std::string errno_text(int err) {
    return std::error_code(err, std::generic_category()).message();
}

// write(2) until everything is out; returns errno or 0
int write_all(int fd, const std::string& data) {
    const char* p = data.data();
    std::size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno;
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }
    return 0;
}

} // namespace

Persister::Persister(fs::path root) : root_(std::move(root)) {}

fs::path Persister::path_for(const std::string& exchange, const std::string& symbol) const {
    return root_ / exchange / (symbol + ".json");
}

std::string Persister::encode(const DepthSnapshot& snap) {
    json j = {
        {"symbol", snap.symbol},
        {"exchange", snap.exchange},
        {"time", snap.time_ms},
        {"last_update_id", snap.last_update_id},
        {"state", to_string(snap.state)},
        {"bids", encode_side(snap.bids)},
        {"asks", encode_side(snap.asks)},
    };
    return j.dump();
}

DepthSnapshot Persister::decode(const std::string& text) {
    try {
        auto j = json::parse(text);
        DepthSnapshot snap;
        snap.symbol = j.at("symbol").get<std::string>();
        snap.exchange = j.at("exchange").get<std::string>();
        snap.time_ms = j.at("time").get<std::int64_t>();
        snap.last_update_id = j.at("last_update_id").get<std::uint64_t>();
        const auto state = parse_book_state(j.at("state").get<std::string>());
        if (!state) {
            throw PersistenceError("unknown book state in snapshot");
        }
        snap.state = *state;
        snap.bids = decode_side(j.at("bids"));
        snap.asks = decode_side(j.at("asks"));
        return snap;
    } catch (const json::exception& e) {
        throw PersistenceError(std::string("cannot decode snapshot: ") + e.what());
    }
}

void Persister::write(const DepthSnapshot& snap) {
    const fs::path target = path_for(snap.exchange, snap.symbol);
    const fs::path dir = target.parent_path();

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw PersistenceError("cannot create " + dir.string() + ": " + ec.message());
    }

    const std::string body = encode(snap);
    const fs::path tmp = dir / (snap.symbol + ".json.tmp." + std::to_string(::getpid()) + "." +
                                std::to_string(tmp_seq_.fetch_add(1, std::memory_order_relaxed)));

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw PersistenceError("cannot open " + tmp.string() + ": " + errno_text(errno));
    }

    int err = write_all(fd, body);
    if (err == 0 && ::fsync(fd) != 0) err = errno;
    if (::close(fd) != 0 && err == 0) err = errno;
    if (err != 0) {
        fs::remove(tmp, ec);
        throw PersistenceError("cannot write " + tmp.string() + ": " + errno_text(err));
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        throw PersistenceError("cannot replace " + target.string() + ": " + ec.message());
    }
}

std::optional<DepthSnapshot> Persister::read(const std::string& exchange, const std::string& symbol) const {
    const fs::path target = path_for(exchange, symbol);
    std::ifstream in(target);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return decode(ss.str());
}
