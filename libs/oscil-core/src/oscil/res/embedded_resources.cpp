#include <oscil/res/embedded_resources.hpp>

#include <cmrc/cmrc.hpp>

CMRC_DECLARE(Oscil_core_rc);

namespace oscil::res {

std::optional<std::string_view> LoadText(const std::string &path) {
    auto fs = cmrc::Oscil_core_rc::get_filesystem();
    if (!fs.is_file(path)) {
        return std::nullopt;
    }
    cmrc::file contents = fs.open(path);
    return std::string_view{contents.begin(), contents.end()};
}

} // namespace oscil::res
