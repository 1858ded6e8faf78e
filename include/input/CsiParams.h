#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace VTInput::Input {

/**
 * @brief Parsed view of a complete CSI sequence.
 *
 * Splits the parameter bytes into semicolon-separated parameters, each
 * holding colon-separated sub-values. Empty values are stored as -1 so
 * callers can tell "absent" from 0. The private marker ('<', '=', '>',
 * '?') is only recognized as the first parameter byte.
 */
class CsiParams {
public:
    // seq starts with ESC [ or the 8-bit CSI byte and ends with the final byte
    explicit CsiParams(std::string_view seq);

    char Marker() const { return m_marker; }
    char Intermediate() const { return m_intermediate; }
    char Final() const { return m_final; }

    size_t Count() const { return m_params.size(); }
    size_t SubCount(size_t index) const;

    // First sub-value of parameter index, or defaultValue when absent
    int Get(size_t index, int defaultValue = 0) const;

    // Sub-value sub of parameter index, or defaultValue when absent
    int GetSub(size_t index, size_t sub, int defaultValue = 0) const;

    // True when parameter index exists and its first value is not empty
    bool Has(size_t index) const;

private:
    char m_marker = 0;
    char m_intermediate = 0;
    char m_final = 0;
    std::vector<std::vector<int>> m_params;
};

} // namespace VTInput::Input
