// Explaining why two values differ: declare types, read two literals, compare.
#include <iostream>
#include "deepeq/compare.hpp"
#include "deepeq/diagnostics_json.hpp"

using namespace deepeq;

int main(){
    const char* decls = R"EDN(
        (types
          (record :name Address :fields [ (field :name City :type string) (field :name Zip :type u32) ])
          (record :name Person :fields [
            (field :name Name :type string)
            (field :name Home :type (ptr Address))
            (field :name Scores :type (map string f64))
            (field :name Friends :type (seq (ptr Person)))
            (field :name Extra :type any) ]))
    )EDN";

    TypeContext types;
    ValueContext vals(types);
    try{
        types.declare(decls);
        auto *alice = vals.read("Person", R"EDN({:Name "Alice" :Home {:City "Oslo" :Zip 150}
                                                :Scores {"math" 9.5 "art" 7.0} :Extra #u8 1})EDN");
        auto *alice2 = vals.read("Person", R"EDN({:Name "Alice" :Home {:City "Oslo" :Zip 151}
                                                 :Scores {"math" 9.5 "art" 7.0} :Extra #u8 1})EDN");

        // Alice is her own friend in both copies; the comparison still terminates.
        TypeId friends = types.parse_type("(seq (ptr Person))");
        vals.set_field(alice, "Friends", vals.make_sequence(friends, {vals.make_ref(alice)}));
        vals.set_field(alice2, "Friends", vals.make_sequence(friends, {vals.make_ref(alice2)}));

        Comparator cmp(types);
        auto res = cmp.compare(alice, alice2);
        if(res.equal){
            std::cout << "equal\n";
            return 0;
        }
        std::cout << res.message << "\n";
        std::cout << divergence_to_json(res) << "\n";
    }catch(const std::exception& e){
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
