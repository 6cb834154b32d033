// Sum types example: declare, construct, compile a match, dispatch.
#include <iostream>
#include <string>
#include "alkey/engine.hpp"

using namespace alkey;

int main(){
    const char* src = R"EDN(
        (sum :name Shape :variants [ (variant :name Circle :fields [ (field :name r :type float) ])
                                     (variant :name Rect :fields [ (field :name w :type float) (field :name h :type float) ])
                                     (variant :name Empty) ])
        (instance :type Shape :variant Rect :fields {:w 2.0 :h 3.0})
    )EDN";

    Engine engine;
    SchemaResult r = engine.load(src, "sum_example");
    if(!r.success){
        std::cerr << "Schema load failed (" << r.errors.size() << ")\n";
        for(const auto& e : r.errors){ std::cerr << e.code << ": " << e.message << "\n"; }
        return 1;
    }

    auto area = engine.compile("Shape", {
        on("Circle", [](const Instance& i){ double r = i.at("r").as<double>(); return value(3.14159 * r * r); }),
        on("Rect", [](const Instance& i){ return value(i.at("w").as<double>() * i.at("h").as<double>()); }),
        on("Empty", [](const Instance&){ return value(0.0); }),
    });

    auto circle = engine.variant("Shape", "Circle", {{"r", 1.0}});
    std::cout << to_string(*r.fixtures[0]) << " area " << to_string(engine.dispatch(area, r.fixtures[0])) << "\n";
    std::cout << to_string(*circle) << " area " << to_string(engine.dispatch(area, circle)) << "\n";

    try {
        engine.compile("Shape", { on("Circle", [](const Instance&){ return value(); }) });
        std::cerr << "expected a non-exhaustive match\n";
        return 2;
    } catch (const CompileError& e) {
        std::cout << e.what() << "\n";
    }
    std::cout << "sum example OK\n";
    return 0;
}
