// schema_types.cpp - Provides the backing logic for schema type definitions and the built-in type registry,
// modelling the simple and complex types that validated elements are annotated with.  Type classification is a
// pattern match over the simple/complex variant so that callers never have to inspect the dynamic type of a
// definition.

#include <psvi/modules/schema.h>

namespace psvi::schema
{
   namespace
   {
      constexpr std::string_view xml_schema_namespace_uri("http://www.w3.org/2001/XMLSchema");

      template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
      template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

      // Tests whether the provided schema type represents a string-like value.

      constexpr bool is_schema_string(SchemaType Type) noexcept
      {
         switch (Type) {
            case SchemaType::XSString:
            case SchemaType::XSNormalizedString:
            case SchemaType::XSToken:
            case SchemaType::XSLanguage:
            case SchemaType::XSName:
            case SchemaType::XSNCName:
            case SchemaType::XSID:
            case SchemaType::XSIDRef:
            case SchemaType::XSAnyURI:
               return true;
            default:
               return false;
         }
      }

      // Tests whether the provided schema type represents a numeric value category.

      constexpr bool is_schema_numeric(SchemaType Type) noexcept
      {
         switch (Type) {
            case SchemaType::XSDecimal:
            case SchemaType::XSFloat:
            case SchemaType::XSDouble:
            case SchemaType::XSInteger:
            case SchemaType::XSNonNegativeInteger:
            case SchemaType::XSPositiveInteger:
            case SchemaType::XSLong:
            case SchemaType::XSInt:
            case SchemaType::XSShort:
            case SchemaType::XSByte:
            case SchemaType::XSUnsignedLong:
            case SchemaType::XSUnsignedInt:
            case SchemaType::XSUnsignedShort:
            case SchemaType::XSUnsignedByte:
               return true;
            default:
               return false;
         }
      }
   }

   TypeDefinition::TypeDefinition(std::string Name, std::string NamespaceURI, SimpleTypeInfo Info,
      const TypeDefinition *Base, bool Builtin)
      : base_type(Base), builtin_type(Builtin), type_name(std::move(Name)), namespace_uri(std::move(NamespaceURI)),
        info(std::move(Info))
   {
      local_name = std::string(extract_local_name(type_name));
   }

   TypeDefinition::TypeDefinition(std::string Name, std::string NamespaceURI, ComplexTypeInfo Info,
      const TypeDefinition *Base, bool Builtin)
      : base_type(Base), builtin_type(Builtin), type_name(std::move(Name)), namespace_uri(std::move(NamespaceURI)),
        info(std::move(Info))
   {
      local_name = std::string(extract_local_name(type_name));
   }

   const TypeDefinition * TypeDefinition::base() const noexcept
   {
      return base_type;
   }

   bool TypeDefinition::is_builtin() const noexcept
   {
      return builtin_type;
   }

   bool TypeDefinition::is_simple() const noexcept
   {
      return std::holds_alternative<SimpleTypeInfo>(info);
   }

   bool TypeDefinition::is_complex() const noexcept
   {
      return std::holds_alternative<ComplexTypeInfo>(info);
   }

   const SimpleTypeInfo * TypeDefinition::simple() const noexcept
   {
      return std::get_if<SimpleTypeInfo>(&info);
   }

   const ComplexTypeInfo * TypeDefinition::complex() const noexcept
   {
      return std::get_if<ComplexTypeInfo>(&info);
   }

   // True for simple types and for complex types whose content type is simple.  Only elements validated by such types
   // carry a schema value.

   bool TypeDefinition::has_simple_value() const noexcept
   {
      return std::visit(overloaded {
         [](const SimpleTypeInfo &) { return true; },
         [](const ComplexTypeInfo &Complex) { return Complex.content_type IS ContentType::Simple; }
      }, info);
   }

   // Returns the simple type that governs the element's value, or nullptr if the type has no simple value.

   const TypeDefinition * TypeDefinition::value_type() const noexcept
   {
      return std::visit(overloaded {
         [this](const SimpleTypeInfo &) -> const TypeDefinition * { return this; },
         [](const ComplexTypeInfo &Complex) -> const TypeDefinition * {
            if (Complex.content_type IS ContentType::Simple) return Complex.simple_content;
            return nullptr;
         }
      }, info);
   }

   bool TypeDefinition::is_union() const noexcept
   {
      auto type = value_type();
      if (not type) return false;
      if (auto simple_info = type->simple()) return simple_info->variety IS Variety::Union;
      return false;
   }

   SchemaType TypeDefinition::value_kind() const noexcept
   {
      auto type = value_type();
      if (not type) return SchemaType::Unavailable;

      auto simple_info = type->simple();
      if (not simple_info) return SchemaType::Unavailable;

      switch (simple_info->variety) {
         case Variety::Atomic: return simple_info->builtin_kind;
         case Variety::Union:  return SchemaType::XSAnySimpleType;
         case Variety::List:
            if ((simple_info->item_type) and (simple_info->item_type->is_union())) return SchemaType::ListOfUnion;
            return SchemaType::List;
      }

      return SchemaType::Unavailable;
   }

   // Determines whether the definition ultimately derives from the requested built-in type.

   bool TypeDefinition::is_derived_from(SchemaType Target) const noexcept
   {
      if (Target IS SchemaType::XSAnyType) return true;
      if ((Target IS SchemaType::XSAnySimpleType) and is_simple()) return true;

      for (auto current = this; current; current = current->base()) {
         if (not current->is_builtin()) continue;
         if (auto simple_info = current->simple()) {
            if ((simple_info->variety IS Variety::Atomic) and (simple_info->builtin_kind IS Target)) return true;
         }
      }

      return false;
   }

   bool TypeDefinition::is_derived_from(const TypeDefinition &Target) const noexcept
   {
      for (auto current = this; current; current = current->base()) {
         if (current IS &Target) return true;
      }

      // Every type derives from the ur-type, even when the chain is not recorded.
      return Target.is_builtin() and Target.is_complex() and (Target.local_name IS "anyType");
   }

   //*****************************************************************************************************************

   SchemaTypeRegistry::SchemaTypeRegistry()
   {
      register_builtin_types();
   }

   // Registers an atomic built-in descriptor for the given type if one does not already exist.

   const TypeDefinition * SchemaTypeRegistry::register_descriptor(SchemaType Type, std::string Name,
      const TypeDefinition *Base)
   {
      if (auto existing = find_descriptor(Type)) return existing;

      SimpleTypeInfo simple_info;
      simple_info.builtin_kind = Type;

      auto descriptor = std::make_shared<TypeDefinition>(std::move(Name), std::string(xml_schema_namespace_uri),
         std::move(simple_info), Base, true);
      descriptors_by_type.emplace(Type, descriptor);
      descriptors_by_name.emplace(descriptor->type_name, descriptor);
      return descriptor.get();
   }

   const TypeDefinition * SchemaTypeRegistry::find_descriptor(SchemaType Type) const
   {
      auto iter = descriptors_by_type.find(Type);
      if (iter != descriptors_by_type.end()) return iter->second.get();
      return nullptr;
   }

   const TypeDefinition * SchemaTypeRegistry::find_descriptor(std::string_view Name) const
   {
      auto iter = descriptors_by_name.find(std::string(Name));
      if (iter != descriptors_by_name.end()) return iter->second.get();

      // Accept the common 'xsd' prefix as an alias for 'xs'
      if (Name.starts_with("xsd:")) {
         iter = descriptors_by_name.find("xs:" + std::string(Name.substr(4)));
         if (iter != descriptors_by_name.end()) return iter->second.get();
      }

      return nullptr;
   }

   const TypeDefinition * SchemaTypeRegistry::any_type() const
   {
      return find_descriptor(SchemaType::XSAnyType);
   }

   size_t SchemaTypeRegistry::size() const noexcept
   {
      return descriptors_by_type.size();
   }

   // Populates the registry with the built-in types of XML Schema Part 2, following their derivation hierarchy.

   void SchemaTypeRegistry::register_builtin_types()
   {
      descriptors_by_type.clear();
      descriptors_by_name.clear();

      ComplexTypeInfo ur_info;
      ur_info.content_type = ContentType::Mixed;
      auto ur_type = std::make_shared<TypeDefinition>("xs:anyType", std::string(xml_schema_namespace_uri), ur_info,
         nullptr, true);
      descriptors_by_type.emplace(SchemaType::XSAnyType, ur_type);
      descriptors_by_name.emplace(ur_type->type_name, ur_type);

      auto AnySimple = register_descriptor(SchemaType::XSAnySimpleType, "xs:anySimpleType", ur_type.get());

      auto String = register_descriptor(SchemaType::XSString, "xs:string", AnySimple);
      auto NormalizedString = register_descriptor(SchemaType::XSNormalizedString, "xs:normalizedString", String);
      auto Token = register_descriptor(SchemaType::XSToken, "xs:token", NormalizedString);
      register_descriptor(SchemaType::XSLanguage, "xs:language", Token);
      auto Name = register_descriptor(SchemaType::XSName, "xs:Name", Token);
      auto NCName = register_descriptor(SchemaType::XSNCName, "xs:NCName", Name);
      register_descriptor(SchemaType::XSID, "xs:ID", NCName);
      register_descriptor(SchemaType::XSIDRef, "xs:IDREF", NCName);

      register_descriptor(SchemaType::XSBoolean, "xs:boolean", AnySimple);
      register_descriptor(SchemaType::XSFloat, "xs:float", AnySimple);
      register_descriptor(SchemaType::XSDouble, "xs:double", AnySimple);
      register_descriptor(SchemaType::XSDuration, "xs:duration", AnySimple);
      register_descriptor(SchemaType::XSDateTime, "xs:dateTime", AnySimple);
      register_descriptor(SchemaType::XSTime, "xs:time", AnySimple);
      register_descriptor(SchemaType::XSDate, "xs:date", AnySimple);
      register_descriptor(SchemaType::XSHexBinary, "xs:hexBinary", AnySimple);
      register_descriptor(SchemaType::XSBase64Binary, "xs:base64Binary", AnySimple);
      register_descriptor(SchemaType::XSAnyURI, "xs:anyURI", AnySimple);
      register_descriptor(SchemaType::XSQName, "xs:QName", AnySimple);
      register_descriptor(SchemaType::XSNotation, "xs:NOTATION", AnySimple);

      auto Decimal = register_descriptor(SchemaType::XSDecimal, "xs:decimal", AnySimple);
      auto Integer = register_descriptor(SchemaType::XSInteger, "xs:integer", Decimal);
      auto Long = register_descriptor(SchemaType::XSLong, "xs:long", Integer);
      auto Int = register_descriptor(SchemaType::XSInt, "xs:int", Long);
      auto Short = register_descriptor(SchemaType::XSShort, "xs:short", Int);
      register_descriptor(SchemaType::XSByte, "xs:byte", Short);

      auto NonNegative = register_descriptor(SchemaType::XSNonNegativeInteger, "xs:nonNegativeInteger", Integer);
      register_descriptor(SchemaType::XSPositiveInteger, "xs:positiveInteger", NonNegative);
      auto UnsignedLong = register_descriptor(SchemaType::XSUnsignedLong, "xs:unsignedLong", NonNegative);
      auto UnsignedInt = register_descriptor(SchemaType::XSUnsignedInt, "xs:unsignedInt", UnsignedLong);
      auto UnsignedShort = register_descriptor(SchemaType::XSUnsignedShort, "xs:unsignedShort", UnsignedInt);
      register_descriptor(SchemaType::XSUnsignedByte, "xs:unsignedByte", UnsignedShort);
   }

   SchemaTypeRegistry & registry()
   {
      static SchemaTypeRegistry global_registry;
      return global_registry;
   }

   bool is_numeric(SchemaType Type) noexcept
   {
      return is_schema_numeric(Type);
   }

   bool is_string_like(SchemaType Type) noexcept
   {
      return is_schema_string(Type);
   }

   std::string_view extract_local_name(std::string_view Qualified) noexcept
   {
      auto colon = Qualified.find(':');
      if (colon IS std::string_view::npos) return Qualified;
      return Qualified.substr(colon + 1);
   }
}
