#pragma once

#include "app/app.hpp" // IWYU pragma: export

namespace fngrader {

class PlanApp final : public App
{
public:
    using App::App;

private:
    int run_impl() override;
};

} // namespace fngrader
