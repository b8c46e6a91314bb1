#include "version.hpp"
#include "util.hpp"

namespace version
{
    /**
     * Splits a "major.minor.patch" version string into its numeric components.
     * @returns 0 on success. -1 if any component is not a number.
     */
    int parse_components(std::vector<uint64_t> &components, std::string_view version)
    {
        std::vector<std::string> parts;
        util::split_string(parts, version, ".");
        if (parts.empty())
            return -1;

        for (const std::string &part : parts)
        {
            uint64_t value = 0;
            if (part.find_first_not_of("0123456789") != std::string::npos || util::stoull(part, value) == -1)
                return -1;
            components.push_back(value);
        }

        return 0;
    }

    /**
     * Compare two version strings in the format of "1.12.3". Missing trailing components count as 0.
     * v1 <  v2  -> returns -1
     * v1 == v2  -> returns  0
     * v1 >  v2  -> returns +1
     * Error     -> returns -2
     */
    int version_compare(const std::string &x, const std::string &y)
    {
        std::vector<uint64_t> cx, cy;
        if (parse_components(cx, x) == -1 || parse_components(cy, y) == -1)
            return -2;

        const size_t len = MAX(cx.size(), cy.size());
        cx.resize(len, 0);
        cy.resize(len, 0);

        for (size_t i = 0; i < len; i++)
        {
            if (cx[i] > cy[i])
                return 1;
            if (cx[i] < cy[i])
                return -1;
        }

        return 0;
    }
}
