#include <oscil/scope/primitive_builder.hpp>

namespace oscil::scope {

void BuildLineStrip(const Signal &signal, const VisibleWindow &window, const ScaleState &scale, LineStrip &out) {
    out.Clear();
    if (signal.IsEmpty() || !scale.IsValid()) {
        return;
    }

    const SurfaceSize size = scale.Size();
    out.vertices.reserve(window.PointCount() * 2);
    for (size_t i = window.beginIndex; i <= window.endIndex; ++i) {
        out.vertices.push_back(PxToPlaneX(TimeToPx(signal, window, scale, i), size.width));
        out.vertices.push_back(PxToPlaneY(AmpToPx(signal, window, scale, i), size.height));
    }
    out.lineCount = static_cast<uint32>(window.endIndex - window.beginIndex);
}

} // namespace oscil::scope
