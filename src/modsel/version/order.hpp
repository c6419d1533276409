#pragma once

namespace modsel {

enum class order {
    less,
    equivalent,
    greater,
};

}  // namespace modsel
