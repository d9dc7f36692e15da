/**
 * @file Event.hpp
 * @brief One <event> record: event info, particles and alternate weights.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

namespace lheutils
{
    /**
     * @struct Particle
     * @brief One particle line of an event.
     *
     * IDUP ISTUP MOTHUP(1,2) ICOLUP(1,2) PUP(1..5) VTIMUP SPINUP
     */
    struct Particle
    {
        int    id = 0;        ///< PDG code
        int    status = 0;    ///< -1 incoming, 1 outgoing, 2 intermediate, ...
        int    mother1 = 0;
        int    mother2 = 0;
        int    color1 = 0;
        int    color2 = 0;
        double px = 0.0;
        double py = 0.0;
        double pz = 0.0;
        double e = 0.0;
        double m = 0.0;
        double lifetime = 0.0;
        double spin = 9.0;    ///< 9 means unpolarized
    };

    /**
     * @struct EventInfo
     * @brief The event header line: NUP IDPRUP XWGTUP SCALUP AQEDUP AQCDUP.
     */
    struct EventInfo
    {
        int    nParticles = 0;
        int    procId = 0;
        double weight = 0.0;    ///< Central weight
        double scale = 0.0;
        double aqed = 0.0;
        double aqcd = 0.0;
    };

    struct Event
    {
        EventInfo info;
        std::vector<Particle> particles;

        /// Alternate weights keyed by the header's weight IDs
        std::map<std::string, double> weights;

        /// Attributes of the <event> element
        std::map<std::string, std::string> attributes;

        void clear()
        {
            info = EventInfo{};
            particles.clear(); // keeps capacity for the next event
            weights.clear();
            attributes.clear();
        }
    };

} // namespace lheutils
