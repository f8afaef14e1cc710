#pragma once

// Registers bank and meters with GeneratorRegistry. Safe to call repeatedly.
void register_builtin_generators();
