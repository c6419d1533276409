#pragma once

namespace modsel::cli {

struct options;

int dispatch_main(const options&) noexcept;

}  // namespace modsel::cli
