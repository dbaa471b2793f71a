#pragma once
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <unordered_map>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <zlib.h>
#include "gambler/IMarketData.hpp"

namespace adapter {

/**
 * CsvFileReplayAdapter
 *
 * Replays daily (or intraday) OHLCV bars from a CSV file, plain or gzip-compressed.
 * zlib's gz reader passes uncompressed files through unchanged, so both go
 * through the same path.
 *
 * Expected header (case-insensitive, any column order, extra columns ignored):
 *   date|datetime|time|timestamp|trade_date, open, high, low, close [, volume|vol] [, symbol|ts_code]
 *
 * e.g. the Yahoo export used by the sample data:
 *   Date,Open,High,Low,Close,Adj Close,Volume
 *   1995-01-03,2.179012,2.191358,2.117284,2.117284,1.883304,36301200
 *
 * Rows are filtered to [from, to] (inclusive, by calendar day), sorted by time,
 * and rows sharing a timestamp with an earlier row are dropped.
 */
class CsvFileReplayAdapter : public gambler::IMarketData {
public:
    struct Options {
        std::string symbol;         // assigned to bars when the file has no symbol column
        std::string from_date;      // YYYY-MM-DD, empty = unbounded
        std::string to_date;        // YYYY-MM-DD, empty = unbounded
    };

    CsvFileReplayAdapter(std::string filepath, Options options)
        : _filepath(std::move(filepath)), _options(std::move(options)), _is_running(false) {}

    ~CsvFileReplayAdapter() override {
        stop();
    }

    // ---- Lifecycle ----

    void start() override {
        _is_running = true;
    }

    void stop() override {
        _is_running = false;
    }

    // ---- Subscription ----

    void subscribe_bars(
        const std::string& symbol,
        std::function<void(const gambler::Bar&)> callback
    ) override {
        _bar_callbacks[symbol] = std::move(callback);
    }

    // ---- Backtest API ----

    /**
     * Replay the loaded bars to the subscribed callbacks.
     * Stops early once stop() has been called (e.g. from inside a callback).
     * @return Number of bars emitted
     */
    std::size_t replay() override {
        if (!_is_running) {
            throw std::runtime_error("Adapter not started; call start() first");
        }
        const auto& bars = load();

        std::size_t bar_count = 0;
        for (const auto& bar : bars) {
            if (!_is_running) break;
            auto it = _bar_callbacks.find(bar.symbol);
            if (it == _bar_callbacks.end()) continue;
            it->second(bar);
            bar_count++;
        }
        return bar_count;
    }

    /**
     * Read, parse, filter and sort the file. Cached after the first call.
     * Throws std::runtime_error if the file cannot be read or has no usable header.
     */
    const std::vector<gambler::Bar>& load() {
        if (_loaded) return _bars;

        std::vector<std::string> lines;
        try {
            lines = read_lines_gz(_filepath);
        } catch (const std::exception& e) {
            throw std::runtime_error(
                "Failed to read CSV file '" + _filepath + "': " + std::string(e.what())
            );
        }
        if (lines.empty()) {
            throw std::runtime_error("CSV file '" + _filepath + "' is empty");
        }

        const Columns cols = parse_header(lines.front());
        const auto from = parse_day_bound(_options.from_date, "from");
        auto to = parse_day_bound(_options.to_date, "to");
        if (to) *to += std::chrono::days{1};    // inclusive end day

        for (std::size_t i = 1; i < lines.size(); ++i) {
            if (lines[i].empty()) continue;
            auto bar = parse_row(lines[i], cols);
            if (!bar) {
                _skipped_rows++;
                continue;
            }
            if (!_options.symbol.empty() && bar->symbol != _options.symbol) continue;
            if (from && bar->ts < *from) continue;
            if (to && bar->ts >= *to) continue;
            _bars.push_back(std::move(*bar));
        }

        std::stable_sort(_bars.begin(), _bars.end(),
                         [](const gambler::Bar& a, const gambler::Bar& b) { return a.ts < b.ts; });
        auto last = std::unique(_bars.begin(), _bars.end(),
                                [](const gambler::Bar& a, const gambler::Bar& b) {
                                    return a.ts == b.ts && a.symbol == b.symbol;
                                });
        _duplicate_rows = static_cast<std::size_t>(std::distance(last, _bars.end()));
        _bars.erase(last, _bars.end());

        std::cout << "[CsvFileReplayAdapter] Loaded " << _bars.size() << " bars from " << _filepath;
        if (_skipped_rows > 0) std::cout << " (" << _skipped_rows << " malformed rows skipped)";
        if (_duplicate_rows > 0) std::cout << " (" << _duplicate_rows << " duplicate timestamps dropped)";
        std::cout << "\n";

        _loaded = true;
        return _bars;
    }

    std::size_t skipped_rows() const { return _skipped_rows; }
    std::size_t duplicate_rows() const { return _duplicate_rows; }

    /**
     * Parse "YYYY-MM-DD", "YYYY-MM-DD HH:MM[:SS]", "YYYY-MM-DDTHH:MM[:SS]" or "YYYYMMDD" as UTC.
     */
    static std::optional<gambler::TimePoint> parse_timestamp(const std::string& text) {
        int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
        std::size_t pos = 0;

        auto read_int = [&text, &pos](std::size_t width, int& out) {
            if (pos + width > text.size()) return false;
            int v = 0;
            for (std::size_t k = 0; k < width; ++k) {
                char c = text[pos + k];
                if (c < '0' || c > '9') return false;
                v = v * 10 + (c - '0');
            }
            out = v;
            pos += width;
            return true;
        };
        auto expect = [&text, &pos](char c) {
            if (pos >= text.size() || text[pos] != c) return false;
            ++pos;
            return true;
        };

        if (!read_int(4, y)) return std::nullopt;
        const bool dashed = expect('-');
        if (!read_int(2, mo)) return std::nullopt;
        if (dashed && !expect('-')) return std::nullopt;
        if (!read_int(2, d)) return std::nullopt;

        if (pos < text.size()) {
            if (text[pos] != ' ' && text[pos] != 'T') return std::nullopt;
            ++pos;
            if (!read_int(2, h) || !expect(':') || !read_int(2, mi)) return std::nullopt;
            if (expect(':') && !read_int(2, s)) return std::nullopt;
            if (pos < text.size() && text[pos] == 'Z') ++pos;
            if (pos != text.size()) return std::nullopt;
            if (h > 23 || mi > 59 || s > 60) return std::nullopt;
        }

        const std::chrono::year_month_day ymd{
            std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(mo)},
            std::chrono::day{static_cast<unsigned>(d)}};
        if (!ymd.ok()) return std::nullopt;

        return gambler::TimePoint(std::chrono::sys_days{ymd}) +
               std::chrono::hours{h} + std::chrono::minutes{mi} + std::chrono::seconds{s};
    }

private:
    struct Columns {
        int date{-1};
        int open{-1};
        int high{-1};
        int low{-1};
        int close{-1};
        int volume{-1};
        int symbol{-1};
    };

    std::string _filepath;
    Options _options;
    bool _is_running;
    bool _loaded{false};
    std::vector<gambler::Bar> _bars;
    std::size_t _skipped_rows{0};
    std::size_t _duplicate_rows{0};
    std::unordered_map<std::string, std::function<void(const gambler::Bar&)>> _bar_callbacks;

    /**
     * Read and (if needed) decompress the file.
     * Returns its lines without trailing '\r'.
     */
    static std::vector<std::string> read_lines_gz(const std::string& filepath) {
        std::vector<std::string> result;

        gzFile file = gzopen(filepath.c_str(), "rb");
        if (!file) {
            throw std::runtime_error("Cannot open file: " + filepath);
        }

        try {
            char buffer[4096];
            std::string line_buffer;

            while (true) {
                int bytes_read = gzread(file, buffer, sizeof(buffer));
                if (bytes_read < 0) {
                    int errnum = 0;
                    const char* msg = gzerror(file, &errnum);
                    throw std::runtime_error(std::string("Error reading file: ") + (msg ? msg : "unknown"));
                }
                if (bytes_read == 0) {
                    break; // EOF
                }

                line_buffer.append(buffer, bytes_read);

                // Process complete lines
                size_t pos = 0;
                while ((pos = line_buffer.find('\n')) != std::string::npos) {
                    std::string line = line_buffer.substr(0, pos);
                    if (!line.empty() && line.back() == '\r') {
                        line.pop_back();
                    }
                    result.push_back(std::move(line));
                    line_buffer.erase(0, pos + 1);
                }
            }

            // Process remaining line (if file doesn't end with \n)
            if (!line_buffer.empty()) {
                if (line_buffer.back() == '\r') line_buffer.pop_back();
                result.push_back(std::move(line_buffer));
            }

        } catch (const std::exception&) {
            gzclose(file);
            throw;
        }

        gzclose(file);
        return result;
    }

    static std::vector<std::string> split_fields(const std::string& line) {
        std::vector<std::string> fields;
        std::string field;
        for (char c : line) {
            if (c == ',') {
                fields.push_back(trim(field));
                field.clear();
            } else {
                field += c;
            }
        }
        fields.push_back(trim(field));
        return fields;
    }

    static std::string trim(const std::string& s) {
        std::size_t b = 0, e = s.size();
        while (b < e && (std::isspace(static_cast<unsigned char>(s[b])) || s[b] == '"')) ++b;
        while (e > b && (std::isspace(static_cast<unsigned char>(s[e - 1])) || s[e - 1] == '"')) --e;
        return s.substr(b, e - b);
    }

    static std::string lower(std::string s) {
        for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return s;
    }

    Columns parse_header(const std::string& header) const {
        Columns cols;
        const auto names = split_fields(header);
        for (std::size_t i = 0; i < names.size(); ++i) {
            const std::string name = lower(names[i]);
            const int idx = static_cast<int>(i);
            if (name == "date" || name == "datetime" || name == "time" ||
                name == "timestamp" || name == "trade_date") {
                if (cols.date < 0) cols.date = idx;
            } else if (name == "open") {
                cols.open = idx;
            } else if (name == "high") {
                cols.high = idx;
            } else if (name == "low") {
                cols.low = idx;
            } else if (name == "close") {
                cols.close = idx;
            } else if (name == "volume" || name == "vol") {
                cols.volume = idx;
            } else if (name == "symbol" || name == "ts_code") {
                cols.symbol = idx;
            }
        }
        if (cols.date < 0 || cols.open < 0 || cols.high < 0 || cols.low < 0 || cols.close < 0) {
            throw std::runtime_error("CSV file '" + _filepath +
                                     "' needs date, open, high, low and close columns; header was: " + header);
        }
        return cols;
    }

    std::optional<gambler::Bar> parse_row(const std::string& line, const Columns& cols) const {
        const auto fields = split_fields(line);
        auto field = [&fields](int idx) -> const std::string* {
            if (idx < 0 || static_cast<std::size_t>(idx) >= fields.size()) return nullptr;
            return &fields[static_cast<std::size_t>(idx)];
        };
        auto number = [&field](int idx, double& out) {
            const std::string* f = field(idx);
            if (!f || f->empty()) return false;
            try {
                std::size_t used = 0;
                out = std::stod(*f, &used);
                return used == f->size();
            } catch (const std::exception&) {
                return false;
            }
        };

        const std::string* date = field(cols.date);
        if (!date) return std::nullopt;
        auto ts = parse_timestamp(*date);
        if (!ts) return std::nullopt;

        gambler::Bar bar;
        bar.ts = *ts;
        if (!number(cols.open, bar.open) || !number(cols.high, bar.high) ||
            !number(cols.low, bar.low) || !number(cols.close, bar.close)) {
            return std::nullopt;
        }
        // an empty volume cell is 0, a garbled one makes the row malformed
        const std::string* vol = field(cols.volume);
        if (vol && !vol->empty() && !number(cols.volume, bar.volume)) {
            return std::nullopt;
        }

        const std::string* sym = field(cols.symbol);
        bar.symbol = (sym && !sym->empty()) ? *sym : _options.symbol;
        return bar;
    }

    static std::optional<gambler::TimePoint> parse_day_bound(const std::string& date, const char* which) {
        if (date.empty()) return std::nullopt;
        auto tp = parse_timestamp(date);
        if (!tp) {
            throw std::invalid_argument(std::string("Invalid '") + which + "' date: " + date);
        }
        return tp;
    }
};

}
