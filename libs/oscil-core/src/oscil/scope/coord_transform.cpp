#include <oscil/scope/coord_transform.hpp>

namespace oscil::scope {

void ScaleState::Refresh() {
    if (m_size.IsEmpty()) {
        m_timeInPx = 0.0;
        m_ampInPx = 0.0;
        return;
    }
    m_timeInPx = m_timeScaleFactor / m_size.width;
    m_ampInPx = m_ampScaleFactor / m_size.height;
}

} // namespace oscil::scope
