#include "context.hpp"
#include "configuration.hpp"
#include "error.hpp"

GlobalContext::~GlobalContext() = default;

GlobalContext the_context;
