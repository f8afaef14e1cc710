#include "BuiltinGenerators.hpp"
#include "GeneratorRegistry.hpp"
#include "BankGenerator.hpp"
#include "MetersGenerator.hpp"

void register_builtin_generators() {
    GeneratorRegistry::register_generator(BankGenerator::metadata());
    GeneratorRegistry::register_generator(MetersGenerator::metadata());
}
