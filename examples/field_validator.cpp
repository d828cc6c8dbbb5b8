#include "integration/field_validator.hpp"
#include <iostream>
#include <map>
#include <string>
#include <yaml-cpp/yaml.h>

using namespace docval::integration;

static const char *form = R"(
citizen:
  name: Fulano de Tal
  cpf: 123.456.789-09
company:
  name: Empresa Exemplo
  cnpj: 12.345.678/0001-99
)";

int main()
{
    const std::map<std::string, field_validator_fn> validators{
        {"citizen.cpf", cpf_field_validator},
        {"company.cnpj", cnpj_field_validator},
    };

    YAML::Node root = YAML::Load(form);

    int retval = 0;
    for (const auto &[path, validator] : validators) {
        auto dot = path.find('.');
        auto value = root[path.substr(0, dot)][path.substr(dot + 1)].as<std::string>();

        auto error = validator(value);
        if (!error) {
            std::cout << path << ": ok\n";
            continue;
        }

        std::cout << path << ": " << error->code << " (" << error->message << ", document "
                  << error->params.at("document") << ")\n";
        retval = 1;
    }

    return retval;
}
