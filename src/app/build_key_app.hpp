#pragma once

#include "app/app.hpp" // IWYU pragma: export

namespace fngrader {

class BuildKeyApp final : public App
{
public:
    using App::App;

private:
    int run_impl() override;
};

} // namespace fngrader
