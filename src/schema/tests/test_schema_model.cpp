// test_schema_model.cpp - Built-in type registry, type classification and SchemaModel declarations.

#include <psvi/modules/schema.h>
#include <string>
#include "../../core/tests/test_context.h"

using namespace psvi::schema;

void test_builtin_registry(TestContext &Context) {
   auto &types = registry();

   auto any_type = types.any_type();
   Context.expect_true(any_type != nullptr, "xs:anyType is registered");
   Context.expect_true(any_type and any_type->is_complex(), "xs:anyType is a complex type");
   Context.expect_true(any_type and (not any_type->has_simple_value()), "xs:anyType has mixed content");

   auto int_type = types.find_descriptor(SchemaType::XSInt);
   Context.expect_true(int_type != nullptr, "xs:int is registered");
   Context.expect_true(int_type IS types.find_descriptor("xs:int"), "Lookup by name and by kind agree");
   Context.expect_true(int_type IS types.find_descriptor("xsd:int"), "The xsd prefix is accepted");
   Context.expect_true(types.find_descriptor("xs:nothing") IS nullptr, "Unknown names are not found");

   Context.expect_true(int_type->is_derived_from(SchemaType::XSInteger), "xs:int derives from xs:integer");
   Context.expect_true(int_type->is_derived_from(SchemaType::XSDecimal), "xs:int derives from xs:decimal");
   Context.expect_true(not int_type->is_derived_from(SchemaType::XSString), "xs:int does not derive from xs:string");
   Context.expect_true(int_type->is_derived_from(*any_type), "Every type derives from xs:anyType");
   Context.expect_true(int_type->value_kind() IS SchemaType::XSInt, "Atomic value kind is the built-in kind");
   Context.expect_equal(int_type->local_name, std::string("int"), "Local name excludes the prefix");

   auto id_type = types.find_descriptor(SchemaType::XSID);
   Context.expect_true(id_type and id_type->is_derived_from(SchemaType::XSToken), "xs:ID derives from xs:token");

   Context.expect_true(is_numeric(SchemaType::XSUnsignedByte), "xs:unsignedByte is numeric");
   Context.expect_true(not is_numeric(SchemaType::XSString), "xs:string is not numeric");
   Context.expect_true(is_string_like(SchemaType::XSNCName), "xs:NCName is string-like");
   Context.expect_true(types.size() > 30, "All built-in types are registered");
}

void test_type_declarations(TestContext &Context) {
   SchemaModel model("urn:test:orders");

   Context.expect_true(model.empty(), "A new model is empty");

   SimpleTypeInfo quantity_info;
   quantity_info.builtin_kind = SchemaType::XSPositiveInteger;
   auto quantity = model.add_simple_type("QuantityType", quantity_info);
   Context.expect_true(quantity != nullptr, "Atomic type is declared");
   Context.expect_true(quantity->is_derived_from(SchemaType::XSInteger), "Restriction base defaults to the built-in");
   Context.expect_equal(quantity->namespace_uri, std::string("urn:test:orders"), "Type adopts the target namespace");
   Context.expect_true(model.add_simple_type("QuantityType", quantity_info) IS nullptr, "Redefinition is rejected");

   SimpleTypeInfo code_info;
   auto code = model.add_simple_type("CodeType", code_info, model.find_type("xs:token"));
   Context.expect_true(code and (code->value_kind() IS SchemaType::XSToken), "Restriction inherits the base kind");

   SimpleTypeInfo union_info;
   union_info.variety = Variety::Union;
   union_info.member_types = { quantity, code };
   auto either = model.add_simple_type("QuantityOrCode", union_info);
   Context.expect_true(either and either->is_union(), "Union type is declared");
   Context.expect_true(either->value_kind() IS SchemaType::XSAnySimpleType, "Union values have no fixed kind");

   SimpleTypeInfo list_info;
   list_info.variety = Variety::List;
   list_info.item_type = either;
   auto list = model.add_simple_type("QuantityList", list_info);
   Context.expect_true(list and (list->value_kind() IS SchemaType::ListOfUnion), "List of union is classified");

   SimpleTypeInfo bad_list;
   bad_list.variety = Variety::List;
   Context.expect_true(model.add_simple_type("BadList", bad_list) IS nullptr, "List without item type is rejected");

   SimpleTypeInfo bad_union;
   bad_union.variety = Variety::Union;
   bad_union.member_types = { model.find_type("xs:anyType") };
   Context.expect_true(model.add_simple_type("BadUnion", bad_union) IS nullptr, "Complex union member is rejected");

   ComplexTypeInfo price_info;
   price_info.content_type = ContentType::Simple;
   price_info.simple_content = model.find_type("xs:decimal");
   auto price = model.add_complex_type("PriceType", price_info);
   Context.expect_true(price and price->is_complex(), "Complex type is declared");
   Context.expect_true(price->has_simple_value(), "Simple content carries a value");
   Context.expect_true(price->value_kind() IS SchemaType::XSDecimal, "Simple content value kind");

   ComplexTypeInfo order_info;
   order_info.content_type = ContentType::ElementOnly;
   order_info.simple_content = model.find_type("xs:string");
   auto order = model.add_complex_type("OrderType", order_info);
   Context.expect_true(order and (not order->has_simple_value()), "Element-only content carries no value");
   Context.expect_true(order->value_type() IS nullptr, "Stray simple content is discarded");

   ComplexTypeInfo bad_complex;
   bad_complex.content_type = ContentType::Simple;
   Context.expect_true(model.add_complex_type("BadComplex", bad_complex) IS nullptr,
      "Simple content without a type is rejected");

   Context.expect_true(model.add_simple_type("Derived", SimpleTypeInfo(), order) IS nullptr,
      "Simple type cannot derive from a complex type");

   Context.expect_true(model.find_type("ord:PriceType") IS price, "Prefixed lookup resolves the local name");
   Context.expect_true(not model.empty(), "Model is no longer empty");
}

void test_element_declarations(TestContext &Context) {
   SchemaModel model("urn:test:orders");
   model.target_namespace_prefix = "ord";

   SimpleTypeInfo status_info;
   status_info.builtin_kind = SchemaType::XSToken;
   model.add_simple_type("StatusType", status_info);

   ElementDeclaration status;
   status.name = "status";
   status.type_name = "StatusType";
   status.constraint_type = VC::DEFAULT;
   status.constraint_value = "pending";
   auto status_decl = model.add_element(status);
   Context.expect_true(status_decl != nullptr, "Element is declared");
   Context.expect_true(status_decl->type IS model.find_type("StatusType"), "Type name is resolved");
   Context.expect_equal(status_decl->qualified_name, std::string("ord:status"), "Qualified name uses the prefix");
   Context.expect_equal(status_decl->namespace_uri, std::string("urn:test:orders"), "Namespace is defaulted");
   Context.expect_equal(*status_decl->constraint_value, std::string("pending"), "Default value is kept");
   Context.expect_true(model.find_element("status") IS status_decl, "Element can be found");
   Context.expect_true(model.add_element(status) IS nullptr, "Redeclaration is rejected");

   ElementDeclaration note;
   note.name = "note";
   note.constraint_value = "ignored";
   auto note_decl = model.add_element(note);
   Context.expect_true(note_decl and (note_decl->type IS registry().any_type()), "Untyped element is xs:anyType");
   Context.expect_true(not note_decl->constraint_value, "Value without a constraint is dropped");

   ElementDeclaration fixed;
   fixed.name = "version";
   fixed.type_name = "xs:int";
   fixed.constraint_type = VC::FIXED;
   Context.expect_true(model.add_element(fixed) IS nullptr, "Fixed constraint without a value is rejected");

   ElementDeclaration unknown;
   unknown.name = "mystery";
   unknown.type_name = "MysteryType";
   Context.expect_true(model.add_element(unknown) IS nullptr, "Unknown type name is rejected");

   ElementDeclaration unnamed;
   Context.expect_true(model.add_element(unnamed) IS nullptr, "Unnamed element is rejected");

   NotationDeclaration gif;
   gif.name = "gif";
   gif.public_id = "image/gif";
   auto gif_decl = model.add_notation(gif);
   Context.expect_true(gif_decl and (model.find_notation("ord:gif") IS gif_decl), "Notation is declared");
   Context.expect_true(model.add_notation(gif) IS nullptr, "Notation redeclaration is rejected");
}

int main(int ArgCount, char **Args) {
   if (psvi::ProcessLogArgs(ArgCount, (CSTRING *)Args) != ERR::Okay) std::cout << "Ignoring unknown log switches.\n";

   TestContext test_context;
   test_builtin_registry(test_context);
   test_type_declarations(test_context);
   test_element_declarations(test_context);
   test_context.summary();
   return test_context.failed_checks IS 0 ? 0 : 1;
}
