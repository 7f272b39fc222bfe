// ElementExtractor.hpp
// Osculating semi-major axis and eccentricity of a body about its natural
// center, for display. Failures never propagate: the zero pair is returned.

#ifndef SOLARTRACK_ORBITS_ELEMENT_EXTRACTOR_HPP
#define SOLARTRACK_ORBITS_ELEMENT_EXTRACTOR_HPP

#include "solartrack/ephemeris/PositionCalculator.hpp"
#include "solartrack/orbits/OrbitalElements.hpp"
#include <memory>
#include <string>

namespace solartrack::orbits {

class ElementExtractor {
public:
    explicit ElementExtractor(std::shared_ptr<const ephemeris::EphemerisStore> store, bool verbose = false);

    /// Elements at `at`; zero pair (epoch = at) on any failure
    OrbitalElements elements(const std::string& body, const time::Instant& at) const;

private:
    ephemeris::PositionCalculator calculator_;
    bool verbose_;
};

} // namespace solartrack::orbits

#endif // SOLARTRACK_ORBITS_ELEMENT_EXTRACTOR_HPP
