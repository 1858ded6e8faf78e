#include "input/CsiParams.h"

#include <cstdint>

namespace VTInput::Input {

namespace {

// Upper bound for a parameter value; larger inputs saturate
constexpr int kMaxParamValue = 0x7FFFFFF;

} // namespace

CsiParams::CsiParams(std::string_view seq) {
    size_t i = 0;
    if (!seq.empty() && static_cast<uint8_t>(seq[0]) == 0x9B) {
        i = 1;
    } else if (seq.size() >= 2 && seq[0] == '\x1b' && seq[1] == '[') {
        i = 2;
    }

    if (i < seq.size() && seq[i] >= '<' && seq[i] <= '?') {
        m_marker = seq[i];
        ++i;
    }

    std::vector<int> current;
    int value = -1;
    bool any = false;

    for (; i < seq.size(); ++i) {
        char ch = seq[i];
        if (ch >= '0' && ch <= '9') {
            if (value < 0) {
                value = 0;
            }
            if (value < kMaxParamValue / 10) {
                value = value * 10 + (ch - '0');
            } else {
                value = kMaxParamValue;
            }
            any = true;
        } else if (ch == ':') {
            current.push_back(value);
            value = -1;
            any = true;
        } else if (ch == ';') {
            current.push_back(value);
            m_params.push_back(current);
            current.clear();
            value = -1;
            any = true;
        } else if (ch >= 0x20 && ch <= 0x2F) {
            m_intermediate = ch;
        } else if (ch >= 0x40 && ch <= 0x7E) {
            m_final = ch;
            break;
        }
        // Other parameter-range bytes ('<' to '?' after the first) are ignored
    }

    if (any) {
        current.push_back(value);
        m_params.push_back(current);
    }
}

size_t CsiParams::SubCount(size_t index) const {
    if (index >= m_params.size()) {
        return 0;
    }
    return m_params[index].size();
}

int CsiParams::Get(size_t index, int defaultValue) const {
    return GetSub(index, 0, defaultValue);
}

int CsiParams::GetSub(size_t index, size_t sub, int defaultValue) const {
    if (index >= m_params.size() || sub >= m_params[index].size()) {
        return defaultValue;
    }
    int v = m_params[index][sub];
    return v < 0 ? defaultValue : v;
}

bool CsiParams::Has(size_t index) const {
    return index < m_params.size() && !m_params[index].empty() && m_params[index][0] >= 0;
}

} // namespace VTInput::Input
