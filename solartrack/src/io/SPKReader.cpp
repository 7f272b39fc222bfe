/**
 * @file SPKReader.cpp
 * @brief DAF/SPK parsing and Type 2/3/13 segment evaluation
 */

#include "solartrack/io/SPKReader.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace solartrack::io {

// DAF standard record size in bytes
constexpr int RECORD_SIZE = 1024;
constexpr int DBL_SIZE = 8;
// SPK summaries: ND=2 doubles, NI=6 ints -> 5 doubles (40 bytes) per summary
constexpr int SPK_ND = 2;
constexpr int SPK_NI = 6;
constexpr int SUMMARY_SIZE = 40;
constexpr int MAX_SUMMARIES_PER_RECORD = 25;
constexpr int MAX_CHAIN_DEPTH = 8;

// Reverse the byte order of a plain value
template <typename T>
static T swapEndian(T value) {
    unsigned char bytes[sizeof(T)];
    std::memcpy(bytes, &value, sizeof(T));
    std::reverse(bytes, bytes + sizeof(T));
    std::memcpy(&value, bytes, sizeof(T));
    return value;
}

template <typename T>
static T readValue(const std::vector<char>& buffer, std::size_t offset, bool swap) {
    T value;
    std::memcpy(&value, buffer.data() + offset, sizeof(T));
    return swap ? swapEndian(value) : value;
}

SPKReader::SPKReader(const std::string& filename) : filename_(filename) {
    file_.open(filename, std::ios::binary);
    if (!file_) {
        throw std::runtime_error("Could not open SPK file: " + filename);
    }
    file_.seekg(0, std::ios::end);
    file_size_ = file_.tellg();
    file_.seekg(0, std::ios::beg);

    readHeader();
    loadIndex();
}

SPKReader::~SPKReader() {
    if (file_.is_open()) file_.close();
}

void SPKReader::readHeader() {
    if (file_size_ < 2 * RECORD_SIZE) {
        throw std::runtime_error("File too short to be a DAF/SPK kernel: " + filename_);
    }

    // Read file record (first 1024 bytes)
    std::vector<char> buffer = readRecord(1);

    // ID word: "DAF/SPK " (modern) or "NAIF/DAF" (legacy)
    std::string id_word(buffer.data(), 8);
    if (id_word.compare(0, 4, "DAF/") != 0 && id_word != "NAIF/DAF") {
        throw std::runtime_error("Not a DAF file (bad ID word '" + id_word + "'): " + filename_);
    }

    // DAF file record structure:
    // Bytes 0-7: ID word
    // Bytes 8-11: ND (int)
    // Bytes 12-15: NI (int)
    // Bytes 76-79: FWARD (first summary record)
    int nd = readValue<int32_t>(buffer, 8, false);
    int ni = readValue<int32_t>(buffer, 12, false);

    if (nd == SPK_ND && ni == SPK_NI) {
        swap_bytes_ = false; // File matches host
    } else if (swapEndian(nd) == SPK_ND && swapEndian(ni) == SPK_NI) {
        swap_bytes_ = true;
    } else {
        throw std::runtime_error("Unsupported DAF layout (ND=" + std::to_string(nd) +
                                 ", NI=" + std::to_string(ni) + "), expected an SPK kernel: " + filename_);
    }

    forward_record_ = readValue<int32_t>(buffer, 76, swap_bytes_);
    if (forward_record_ < 2) {
        throw std::runtime_error("Corrupt DAF file record (FWARD=" + std::to_string(forward_record_) +
                                 "): " + filename_);
    }
}

void SPKReader::loadIndex() {
    const std::streamoff total_records = file_size_ / RECORD_SIZE;
    const std::streamoff total_doubles = file_size_ / DBL_SIZE;

    int current_rec = forward_record_;
    std::streamoff visited = 0;

    while (current_rec > 0) {
        if (current_rec > total_records || ++visited > total_records) {
            throw std::runtime_error("Corrupt DAF summary chain at record " +
                                     std::to_string(current_rec) + ": " + filename_);
        }
        std::vector<char> record = readRecord(current_rec);

        int next = static_cast<int>(readValue<double>(record, 0, swap_bytes_));
        int ns = static_cast<int>(readValue<double>(record, 16, swap_bytes_));

        if (ns > MAX_SUMMARIES_PER_RECORD || ns < 0) {
            throw std::runtime_error("Corrupt DAF summary record " + std::to_string(current_rec) +
                                     " (NSUM=" + std::to_string(ns) + "): " + filename_);
        }

        for (int i = 0; i < ns; ++i) {
            std::size_t offset = 24 + static_cast<std::size_t>(i) * SUMMARY_SIZE;

            SPKSegment seg;
            seg.start_et = readValue<double>(record, offset, swap_bytes_);
            seg.end_et = readValue<double>(record, offset + 8, swap_bytes_);

            int ints[SPK_NI];
            for (int k = 0; k < SPK_NI; ++k) {
                ints[k] = readValue<int32_t>(record, offset + 16 + k * 4, swap_bytes_);
            }
            seg.body_id = ints[0];
            seg.center_id = ints[1];
            seg.frame_id = ints[2];
            seg.type = ints[3];
            seg.start_addr = ints[4];
            seg.end_addr = ints[5];

            if (seg.start_addr < 1 || seg.end_addr < seg.start_addr || seg.end_addr > total_doubles) {
                throw std::runtime_error("Segment for body " + std::to_string(seg.body_id) +
                                         " points outside the file: " + filename_);
            }

            if (seg.type == 2 || seg.type == 3) {
                // Trailer: INIT, INTLEN, RSIZE, N
                std::vector<double> params = readDoubles(seg.end_addr - 3, 4);
                seg.init_sec = params[0];
                seg.intlen = params[1];
                seg.rsize = static_cast<int>(params[2]);
                seg.n_records = static_cast<int>(params[3]);
                seg.n_comp = (seg.type == 2) ? 3 : 6;

                int n_coeffs = (seg.rsize - 2) / seg.n_comp;
                if (!(seg.intlen > 0.0) || n_coeffs < 1 || seg.n_records < 1 ||
                    static_cast<long long>(seg.rsize) * seg.n_records + 4 > seg.end_addr - seg.start_addr + 1) {
                    throw std::runtime_error("Corrupt Chebyshev segment for body " +
                                             std::to_string(seg.body_id) + ": " + filename_);
                }
                seg.order = n_coeffs - 1;
            }
            else if (seg.type == 13) {
                // Type 13 records are read lazily
                seg.n_comp = 6;
                seg.rsize = 6;
            }
            else {
                // Other segment types are not indexed; the body stays unavailable
                continue;
            }

            segments_.insert({seg.body_id, seg});
        }

        current_rec = next;
    }

    if (segments_.empty()) {
        throw std::runtime_error("SPK file contains no supported segments: " + filename_);
    }
}

std::vector<char> SPKReader::readRecord(int record_idx) const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    std::vector<char> buffer(RECORD_SIZE);
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(record_idx - 1) * RECORD_SIZE, std::ios::beg);
    file_.read(buffer.data(), RECORD_SIZE);
    if (file_.gcount() != RECORD_SIZE) {
        throw std::runtime_error("Short read of DAF record " + std::to_string(record_idx) + ": " + filename_);
    }
    return buffer;
}

std::vector<double> SPKReader::readDoubles(int address, int count) const {
    std::vector<double> out(static_cast<std::size_t>(count));
    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        file_.clear();
        file_.seekg(static_cast<std::streamoff>(address - 1) * DBL_SIZE, std::ios::beg);
        file_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(count) * DBL_SIZE);
        if (file_.gcount() != static_cast<std::streamsize>(count) * DBL_SIZE) {
            throw std::runtime_error("Short read at DAF address " + std::to_string(address) + ": " + filename_);
        }
    }
    if (swap_bytes_) {
        for (double& v : out) v = swapEndian(v);
    }
    return out;
}

const SPKSegment& SPKReader::findSegment(int target_id, double et) const {
    auto range = segments_.equal_range(target_id);
    bool found_body = false;
    // Later segments take precedence, as in SPICE
    const SPKSegment* match = nullptr;
    for (auto it = range.first; it != range.second; ++it) {
        found_body = true;
        if (et >= it->second.start_et && et <= it->second.end_et) {
            match = &it->second;
        }
    }
    if (match) return *match;

    if (!found_body) {
        throw std::runtime_error("Body " + std::to_string(target_id) + " is not in " + filename_);
    }
    std::string spans;
    for (auto it = range.first; it != range.second; ++it) {
        spans += " [" + std::to_string(it->second.start_et) + ", " + std::to_string(it->second.end_et) + "]";
    }
    throw std::runtime_error("Body " + std::to_string(target_id) + " not covered at ET " +
                             std::to_string(et) + "; segments cover" + spans);
}

Eigen::VectorXd SPKReader::getState(int target_id, double et) const {
    return evaluate(findSegment(target_id, et), et);
}

Eigen::VectorXd SPKReader::evaluate(const SPKSegment& seg, double et) const {
    switch (seg.type) {
        case 2:
        case 3:
            return evaluateChebyshev(seg, et);
        case 13:
            return evaluateType13(seg, et);
        default:
            throw std::runtime_error("Unsupported SPK segment type: " + std::to_string(seg.type));
    }
}

Eigen::VectorXd SPKReader::barycentricState(int body_id, double et) const {
    Eigen::VectorXd state = Eigen::VectorXd::Zero(6);
    int current = body_id;
    int depth = 0;
    while (current != 0) {
        if (++depth > MAX_CHAIN_DEPTH) {
            throw std::runtime_error("SPK center chain too deep for body " + std::to_string(body_id));
        }
        const SPKSegment& seg = findSegment(current, et);
        state += evaluate(seg, et);
        current = seg.center_id;
    }
    return state;
}

Eigen::VectorXd SPKReader::getStateRelativeTo(int target_id, int observer_id, double et) const {
    if (target_id == observer_id) return Eigen::VectorXd::Zero(6);

    // Direct segment is exact and cheaper (e.g. Moon wrt EMB)
    auto range = segments_.equal_range(target_id);
    for (auto it = range.first; it != range.second; ++it) {
        if (it->second.center_id == observer_id &&
            et >= it->second.start_et && et <= it->second.end_et) {
            return evaluate(it->second, et);
        }
    }
    return barycentricState(target_id, et) - barycentricState(observer_id, et);
}

bool SPKReader::hasBody(int body_id) const {
    return coverage(body_id).has_value();
}

std::optional<SPKCoverage> SPKReader::coverage(int body_id) const {
    SPKCoverage window{-std::numeric_limits<double>::infinity(), std::numeric_limits<double>::infinity()};
    int current = body_id;
    int depth = 0;
    while (current != 0) {
        auto range = segments_.equal_range(current);
        if (range.first == range.second || ++depth > MAX_CHAIN_DEPTH) return std::nullopt;

        double start = std::numeric_limits<double>::infinity();
        double end = -std::numeric_limits<double>::infinity();
        for (auto it = range.first; it != range.second; ++it) {
            start = std::min(start, it->second.start_et);
            end = std::max(end, it->second.end_et);
        }
        window.start_et = std::max(window.start_et, start);
        window.end_et = std::min(window.end_et, end);
        current = range.first->second.center_id;
    }
    if (depth == 0 || window.end_et <= window.start_et) return std::nullopt;
    return window;
}

std::vector<int> SPKReader::bodies() const {
    std::vector<int> ids;
    for (auto it = segments_.begin(); it != segments_.end(); it = segments_.upper_bound(it->first)) {
        ids.push_back(it->first);
    }
    return ids;
}

Eigen::VectorXd SPKReader::evaluateChebyshev(const SPKSegment& seg, double et) const {
    // Type 2: Chebyshev for Position. Velocity via differentiation.
    // Type 3: Chebyshev for Position and Velocity.

    // 1. Locate record
    // Index = floor((et - init) / intlen), the last record also owns its end point
    int rec_idx = static_cast<int>(std::floor((et - seg.init_sec) / seg.intlen));
    rec_idx = std::clamp(rec_idx, 0, seg.n_records - 1);

    // Read record data (Midpoint, Radius, Coeffs...)
    std::vector<double> buf = readDoubles(seg.start_addr + rec_idx * seg.rsize, seg.rsize);

    double mid = buf[0];
    double rad = buf[1];

    // Normalized time x in [-1, 1]
    double x = (et - mid) / rad;

    // Evaluate Chebyshev polynomials
    int n_coeffs = (seg.rsize - 2) / seg.n_comp; // Number of coefficients per component

    std::vector<double> T(std::max(n_coeffs, 2)); // Tk(x)
    std::vector<double> U(std::max(n_coeffs, 2)); // T'k(x)

    T[0] = 1.0;
    T[1] = x;
    U[0] = 0.0;
    U[1] = 1.0;

    for (int k = 2; k < n_coeffs; ++k) {
        T[k] = 2.0 * x * T[k-1] - T[k-2];
        U[k] = 2.0 * x * U[k-1] - U[k-2] + 2.0 * T[k-1];
    }

    // Sum coefficients
    // Layout: [Mid, Rad, X_coeffs..., Y_coeffs..., Z_coeffs..., (VX, VY, VZ for type 3)]
    double pos[3] = {0, 0, 0};
    double vel[3] = {0, 0, 0};

    for (int comp = 0; comp < 3; ++comp) {
        int offset = 2 + comp * n_coeffs;
        for (int k = 0; k < n_coeffs; ++k) {
            double c = buf[offset + k];
            pos[comp] += c * T[k];
            vel[comp] += c * U[k];
        }
    }

    if (seg.n_comp == 6) {
        for (int comp = 0; comp < 3; ++comp) {
            int offset = 2 + (comp + 3) * n_coeffs;
            vel[comp] = 0.0;
            for (int k = 0; k < n_coeffs; ++k) {
                vel[comp] += buf[offset + k] * T[k];
            }
        }
    } else {
        // Velocity scaling: dx/dt = 1/rad
        for (int i = 0; i < 3; ++i) vel[i] /= rad;
    }

    Eigen::VectorXd state(6);
    state << pos[0], pos[1], pos[2], vel[0], vel[1], vel[2];
    return state;
}

Eigen::VectorXd SPKReader::evaluateType13(const SPKSegment& seg, double et) const {
    // Layout: [N states x 6] [N epochs] [epoch directory] [window size - 1] [N]
    std::vector<double> meta = readDoubles(seg.end_addr - 1, 2);
    int N = static_cast<int>(meta[1]);
    int window = static_cast<int>(std::lround(meta[0])) + 1;

    if (N < 2 || static_cast<long long>(N) * 7 + 2 > seg.end_addr - seg.start_addr + 1) {
        throw std::runtime_error("Invalid Type 13 N: " + std::to_string(N));
    }
    if (window < 2) {
        throw std::runtime_error("Invalid Type 13 window size: " + std::to_string(window));
    }
    window = std::min(window, N);

    std::vector<double> epochs = readDoubles(seg.start_addr + 6 * N, N);

    // Last epoch <= et
    auto it = std::upper_bound(epochs.begin(), epochs.end(), et);
    int low = std::clamp(static_cast<int>(std::distance(epochs.begin(), it)) - 1, 0, N - 1);

    // Even windows straddle the interval holding et, odd ones center on the nearest epoch
    int first;
    if (window % 2 == 0) {
        first = low - window / 2 + 1;
    } else {
        int near = low;
        if (low + 1 < N && epochs[low + 1] - et < et - epochs[low]) near = low + 1;
        first = near - window / 2;
    }
    first = std::clamp(first, 0, N - window);

    std::vector<double> states = readDoubles(seg.start_addr + first * 6, window * 6);

    // Hermite interpolation of degree 2W-1 through the window, on a unit time scale
    const double t0 = epochs[first];
    const double scale = epochs[first + window - 1] - t0;
    const double x = (et - t0) / scale;
    const int n_nodes = 2 * window;

    std::vector<double> z(n_nodes);
    for (int k = 0; k < window; ++k) {
        z[2 * k] = z[2 * k + 1] = (epochs[first + k] - t0) / scale;
    }

    Eigen::VectorXd res(6);
    std::vector<double> q(n_nodes);
    for (int comp = 0; comp < 3; ++comp) {
        // Divided differences, in place; repeated nodes take the derivative
        for (int k = 0; k < window; ++k) {
            q[2 * k] = q[2 * k + 1] = states[6 * k + comp];
        }
        for (int k = n_nodes - 1; k >= 1; --k) {
            if (k % 2 == 1) {
                q[k] = states[6 * (k / 2) + 3 + comp] * scale;
            } else {
                q[k] = (q[k] - q[k - 1]) / (z[k] - z[k - 1]);
            }
        }
        for (int order = 2; order < n_nodes; ++order) {
            for (int k = n_nodes - 1; k >= order; --k) {
                q[k] = (q[k] - q[k - 1]) / (z[k] - z[k - order]);
            }
        }

        // Newton form with its derivative, Horner style
        double p = q[n_nodes - 1];
        double dp = 0.0;
        for (int k = n_nodes - 2; k >= 0; --k) {
            dp = dp * (x - z[k]) + p;
            p = p * (x - z[k]) + q[k];
        }
        res[comp] = p;
        res[comp + 3] = dp / scale;
    }
    return res;
}

} // namespace solartrack::io
