// validated_value.cpp - The schema value of a validated element: its normalized lexical form, the typed actual value
// and the simple types that produced it.

#include <psvi/modules/psvi.h>
#include <psvi/log.h>

namespace psvi {

const StringList & empty_string_list() noexcept
{
   static const StringList empty_list;
   return empty_list;
}

const KindList & empty_kind_list() noexcept
{
   static const KindList empty_list;
   return empty_list;
}

//********************************************************************************************************************

void ValidatedValue::copy_from(const ValidatedValue &Source)
{
   if (&Source IS this) return;
   normalized      = Source.normalized;
   actual          = Source.actual;
   actual_kind     = Source.actual_kind;
   actual_type_ref = Source.actual_type_ref;
   member_type_ref = Source.member_type_ref;
   list_kinds      = Source.list_kinds;
}

// Returns the value to its initial state.  Repeated calls have no further effect.

void ValidatedValue::reset() noexcept
{
   normalized.reset();
   actual = std::monostate{};
   actual_kind = schema::SchemaType::Unavailable;
   actual_type_ref = nullptr;
   member_type_ref = nullptr;
   list_kinds.clear();
}

// The member type is only meaningful for values of a union type and is discarded otherwise.  List item kinds always
// belong to the previous value and are cleared.

void ValidatedValue::set_value(std::string Normalized, ActualValue Actual, schema::SchemaType Kind,
   const schema::TypeDefinition *ActualType, const schema::TypeDefinition *MemberType)
{
   normalized = std::move(Normalized);
   actual = std::move(Actual);
   actual_kind = Kind;
   actual_type_ref = ActualType;
   member_type_ref = ((ActualType) and (ActualType->is_union())) ? MemberType : nullptr;
   list_kinds.clear();
}

// Item kinds for the current list value, one per item.  Must follow set_value() and is refused for atomic values.

ERR ValidatedValue::set_list_value_kinds(KindList Kinds)
{
   psvi::Log log(__FUNCTION__);

   if ((actual_kind != schema::SchemaType::List) and (actual_kind != schema::SchemaType::ListOfUnion)) {
      return log.warning(ERR::Mismatch);
   }

   if (auto items = std::get_if<std::vector<AtomicValue>>(&actual)) {
      if (items->size() != Kinds.size()) {
         log.warning("%d item kinds were provided for %d list items.", int(Kinds.size()), int(items->size()));
         return ERR::Mismatch;
      }
   }

   list_kinds = std::move(Kinds);
   return ERR::Okay;
}

const KindList & ValidatedValue::list_value_kinds() const noexcept
{
   if (list_kinds.empty()) return empty_kind_list();
   return list_kinds;
}

bool ValidatedValue::empty() const noexcept
{
   return (not normalized) and std::holds_alternative<std::monostate>(actual) and
      (actual_kind IS schema::SchemaType::Unavailable) and (not actual_type_ref) and (not member_type_ref) and
      list_kinds.empty();
}

} // namespace
