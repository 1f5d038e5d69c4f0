//
// Created by gregorian-rayne on 02/12/26.
//

#ifndef COVSCOPE_TEST_FIXTURES_HPP
#define COVSCOPE_TEST_FIXTURES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace covscope::fixtures {

    /**
     * One <class> element of a generated JaCoCo report.
     */
    struct ClassSpec {
        std::string name;             ///< Slash separated, as JaCoCo writes it
        std::uint64_t line_missed = 0;
        std::uint64_t line_covered = 0;
        std::uint64_t branch_missed = 0;
        std::uint64_t branch_covered = 0;
        bool with_branch = true;
    };

    /**
     * Builds a JaCoCo-shaped report. Each class carries method-level counters
     * (which must be ignored) followed by its own LINE and BRANCH counters.
     * Report-level totals are appended as well, as JaCoCo does.
     */
    inline std::string jacoco_report(const std::vector<ClassSpec>& classes) {
        std::string xml =
            "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
            "<!DOCTYPE report PUBLIC \"-//JACOCO//DTD Report 1.1//EN\" \"report.dtd\">\n"
            "<report name=\"fixture\">\n"
            "  <sessioninfo id=\"s1\" start=\"1\" dump=\"2\"/>\n";

        std::uint64_t total_missed = 0;
        std::uint64_t total_covered = 0;
        for (const auto& spec : classes) {
            const auto slash = spec.name.rfind('/');
            const std::string package = slash == std::string::npos ? "" : spec.name.substr(0, slash);

            xml += "  <package name=\"" + package + "\">\n";
            xml += "    <class name=\"" + spec.name + "\" sourcefilename=\"X.java\">\n";
            xml += "      <method name=\"run\" desc=\"()V\" line=\"3\">\n";
            xml += "        <counter type=\"LINE\" missed=\"999\" covered=\"1\"/>\n";
            xml += "      </method>\n";
            xml += "      <counter type=\"INSTRUCTION\" missed=\"7\" covered=\"7\"/>\n";
            xml += "      <counter type=\"LINE\" missed=\"" + std::to_string(spec.line_missed) +
                   "\" covered=\"" + std::to_string(spec.line_covered) + "\"/>\n";
            if (spec.with_branch) {
                xml += "      <counter type=\"BRANCH\" missed=\"" + std::to_string(spec.branch_missed) +
                       "\" covered=\"" + std::to_string(spec.branch_covered) + "\"/>\n";
            }
            xml += "    </class>\n";
            xml += "    <counter type=\"LINE\" missed=\"" + std::to_string(spec.line_missed) +
                   "\" covered=\"" + std::to_string(spec.line_covered) + "\"/>\n";
            xml += "  </package>\n";

            total_missed += spec.line_missed;
            total_covered += spec.line_covered;
        }

        xml += "  <counter type=\"LINE\" missed=\"" + std::to_string(total_missed) +
               "\" covered=\"" + std::to_string(total_covered) + "\"/>\n";
        xml += "</report>\n";
        return xml;
    }

}  // namespace covscope::fixtures

#endif //COVSCOPE_TEST_FIXTURES_HPP
