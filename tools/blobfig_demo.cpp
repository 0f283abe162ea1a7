#include "blobfig/blobfig.hpp"
#include "blobfig/easy.hpp"

#include <cstdint>
#include <cstring>
#include <iostream>
#include <vector>


// Row-major fill for 2D: idx = r*cols + c
static std::vector<double> make_A_2x3_rowmajor() {
    // A = [ 1 2 3
    //       4 5 6 ]
    return {1, 2, 3, 4, 5, 6};
}

int main() {
    try {
        using namespace blobfig;

        Value::Object model;
        easy::set(model, "name", Value::make_string("tiny-mlp"));
        easy::set(model, "layers", Value::make_int(2));
        easy::set(model, "dropout", Value::make_float(0.1));

        // 2x3 double matrix
        easy::set(model, "A", easy::make_value<double>({2, 3}, make_A_2x3_rowmajor()));

        // 4-element float vector
        easy::set(model, "mean", easy::make_value<float>({4}, {0.1f, 0.2f, 0.3f, 0.4f}));

        // 3x3x4 int32
        std::vector<std::int32_t> dataC(3 * 3 * 4);
        for (std::size_t i = 0; i < dataC.size(); ++i) dataC[i] = (std::int32_t)i;
        easy::set(model, "C", easy::make_value<std::int32_t>({3, 3, 4}, dataC));

        Value::Object root;
        easy::set(root, "version", Value::make_int(1));
        easy::set(root, "model", Value::make_object(std::move(model)));
        easy::set(root, "readme", Value::make_file(File("text/plain", {'h', 'e', 'l', 'l', 'o'})));

        // Write
        std::string file = "demo_out.blbf";
        write_file(file, Value::make_object(std::move(root)));

        std::cout << "Wrote: " << file << "\n";

        // Read back; the views below borrow from `bytes`.
        std::vector<std::uint8_t> bytes = load_bytes(file);
        ValueView view = parse(bytes, ParseOptions{.validate = true});

        ArrayView A = view.at("model/A").as_array();
        std::cout << "Read A: dtype=" << to_string(A.dtype())
                  << " shape=[" << A.dim(0) << " x " << A.dim(1) << "]"
                  << " bytes=" << A.data().size()
                  << " offset=" << A.offset()
                  << "\n";

        auto mean = easy::elements<float>(view.at("model/mean").as_array());
        std::cout << "Read mean:";
        for (float x : mean) std::cout << " " << x;
        std::cout << "\n";

        if (auto name = view.get_string("model/name")) {
            std::cout << "Read name: " << *name << "\n";
        }

        std::cout << "OK\n";
        return 0;

    } catch (const blobfig::Error& e) {
        std::cerr << "blobfig error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
