/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#include <stash/stash.hxx>

#include <iostream>

STASH_INIT;

using namespace stash;

// A user type that externalizes its state as a map.
struct Model : public Stateful
{
    Value get_state() const override {
        Map state;
        state.insert({"epoch", epoch});
        state.insert({"weights", weights});
        return state;
    }

    void set_state(const Value& state) override {
        epoch = state.get("epoch").as<Int>();
        weights = state.get("weights");
    }

    Opaque* clone() const override { return new Model{*this}; }
    String str() const override    { return fmt::format("Model(epoch={})", epoch); }

    Int epoch = 0;
    Value weights = nil;
};

int main(int argc, char** argv) {
    URI uri = argc > 1? URI(argv[1]): "mem://checkpoint.zip"_uri;
    if (argc > 2) stash::log::set_level(stash::log::DEBUG);

    register_stateful<Model>("model");

    auto model = Value::make<Model>();
    model.as<Model>().epoch = 12;
    model.as<Model>().weights = Value::make<NDArray>(NDArray::from_vector(std::vector<double>{0.1, 0.2, 0.3}));

    auto config = json::parse(R"({"lr": 0.01, "layers": [64, 32]})");

    // write a checkpoint; the config is stored once and shared by both entries
    {
        ArchiveWriter writer{uri, Options{.clobber = true}};
        writer.put("model", model);
        writer.put("config", config);
        writer.put("model_config", config);
        writer.set_attribute("host", "worker-3");
        writer.finalize();
    }

    // read back only what is needed
    ArchiveReader reader{uri};
    std::cout << "keys=" << Value{List(reader.keys().begin(), reader.keys().end())} << std::endl;
    std::cout << "layers[0]=" << reader.get("config.layers[0]"_path) << std::endl;
    std::cout << "epoch=" << reader.get("model.epoch"_path) << std::endl;

    auto loaded = reader.get("model"_path);
    std::cout << "model=" << loaded << std::endl;
    std::cout << "weights=" << loaded.as<Model>().weights << std::endl;

    bool shared = reader.get("config"_path).is(reader.get("model_config"_path));
    std::cout << "config shared=" << (shared? "true": "false") << std::endl;

    // replace one entry, keeping the rest
    Map updates;
    updates.insert({"note", "fine-tuned"});
    replace(uri, updates);
    std::cout << "after replace=" << Value{List{load(uri).get("note")}} << std::endl;
}
