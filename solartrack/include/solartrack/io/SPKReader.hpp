/**
 * @file SPKReader.hpp
 * @brief Native reader for JPL SPK (Binary SPICE Kernel) files
 * @author SolarTrack Team
 *
 * Implements a lightweight, dependency-free reader for DAF/SPK files
 * (Types 2, 3 and 13). Compatible with JPL DE4xx planetary ephemerides.
 */

#ifndef SOLARTRACK_IO_SPK_READER_HPP
#define SOLARTRACK_IO_SPK_READER_HPP

#include <string>
#include <vector>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <Eigen/Dense>

namespace solartrack::io {

/**
 * @brief Represents a segment within an SPK file
 */
struct SPKSegment {
    int body_id = 0;            ///< Target body NAIF ID
    int center_id = 0;          ///< Center body NAIF ID (e.g. 0 for SSB)
    int frame_id = 0;           ///< Reference frame ID (1=J2000)
    int type = 0;               ///< Data type (2=Chebyshev Pos, 3=Chebyshev Pos+Vel, 13=Hermite)
    double start_et = 0.0;      ///< Start epoch (seconds past J2000)
    double end_et = 0.0;        ///< End epoch (seconds past J2000)
    int start_addr = 0;         ///< Address of first data double (1-based)
    int end_addr = 0;           ///< Address of last data double (1-based)

    // Type 2/3 specific parameters
    double init_sec = 0.0;      ///< Initial epoch of first record
    double intlen = 0.0;        ///< Length of interval in seconds
    int rsize = 0;              ///< Record size (number of doubles)
    int n_records = 0;          ///< Number of Chebyshev records
    int order = 0;              ///< Polynomial order (N)
    int n_comp = 0;             ///< Number of components (3 or 6)
};

/**
 * @brief Time span [start_et, end_et] covered for a body [s past J2000 TDB]
 */
struct SPKCoverage {
    double start_et;
    double end_et;
};

/**
 * @brief Reader for binary SPK files (DAF format)
 *
 * The segment index is built once at construction; afterwards the reader is
 * logically immutable. Data reads go through a single file handle guarded by
 * an internal mutex, so one reader can be shared between threads.
 */
class SPKReader {
public:
    /**
     * @brief Open and index an SPK file
     * @throws std::runtime_error if the file is missing or not a valid DAF/SPK file
     */
    explicit SPKReader(const std::string& filename);
    ~SPKReader();

    SPKReader(const SPKReader&) = delete;
    SPKReader& operator=(const SPKReader&) = delete;

    /**
     * @brief Get position and velocity of a target body relative to its segment center
     * @param target_id NAIF ID of target body
     * @param et Ephemeris time (seconds past J2000 TDB)
     * @return State vector [x, y, z, vx, vy, vz] in km and km/s
     */
    Eigen::VectorXd getState(int target_id, double et) const;

    /**
     * @brief State of target relative to observer, resolving both center chains
     *
     * Each body is walked down its chain of segment centers to the solar
     * system barycenter (0), e.g. Moon 301 -> 3 -> 0, then the two
     * barycentric states are differenced.
     */
    Eigen::VectorXd getStateRelativeTo(int target_id, int observer_id, double et) const;

    /// True if the body has segments chaining it to the barycenter; false for 0 itself
    bool hasBody(int body_id) const;

    /// Coverage of the full center chain of a body, if present
    std::optional<SPKCoverage> coverage(int body_id) const;

    /// NAIF IDs of every indexed target body
    std::vector<int> bodies() const;

    const std::string& filename() const { return filename_; }
    std::size_t segmentCount() const { return segments_.size(); }
    bool isOpen() const { return file_.is_open(); }

private:
    mutable std::ifstream file_;
    mutable std::mutex io_mutex_;
    std::string filename_;
    bool swap_bytes_ = false;   // File endianness differs from host
    std::streamoff file_size_ = 0;
    int forward_record_ = 0;

    // Index of segments mapped by target ID
    // A body might have multiple segments covering different time ranges
    std::multimap<int, SPKSegment> segments_;

    void readHeader();
    void loadIndex();

    // Low-level read: count doubles starting at 1-based DAF address
    std::vector<double> readDoubles(int address, int count) const;
    std::vector<char> readRecord(int record_idx) const; // 1-based record index (1 record = 1024 bytes)

    const SPKSegment& findSegment(int target_id, double et) const;
    Eigen::VectorXd evaluate(const SPKSegment& seg, double et) const;
    Eigen::VectorXd barycentricState(int body_id, double et) const;

    // Chebyshev evaluation
    Eigen::VectorXd evaluateChebyshev(const SPKSegment& seg, double et) const;
    // Hermite over the segment window (unequal time steps)
    Eigen::VectorXd evaluateType13(const SPKSegment& seg, double et) const;
};

} // namespace solartrack::io

#endif // SOLARTRACK_IO_SPK_READER_HPP
