// Stable diagnostic codes reported by the type checker.
#pragma once

namespace tagc::diag
{
    // enum / struct construction and lookup
    inline constexpr const char *UndefinedType = "E1400";
    inline constexpr const char *UndefinedVariant = "E1401";
    inline constexpr const char *ArityMismatch = "E1402";
    inline constexpr const char *UndefinedField = "E1403";
    inline constexpr const char *MissingField = "E1404";
    inline constexpr const char *FieldTypeMismatch = "E1405";
    inline constexpr const char *DuplicateInit = "E1406";

    // declarations
    inline constexpr const char *MalformedDecl = "E1410";
    inline constexpr const char *DuplicateDecl = "E1411";
    inline constexpr const char *DuplicateMember = "E1412";
    inline constexpr const char *UnknownFunction = "E1413";
    inline constexpr const char *CallArity = "E1414";
    inline constexpr const char *MissingReturn = "E1415";
    inline constexpr const char *TypeMismatch = "E1416";
    inline constexpr const char *InvalidOperand = "E1417";

    // match
    inline constexpr const char *NonExhaustiveMatch = "E1420";
    inline constexpr const char *DuplicateCase = "E1421";
    inline constexpr const char *BindIndex = "E1422";

    // ownership
    inline constexpr const char *UseAfterMove = "E2001";
    inline constexpr const char *UndefinedVariable = "E2002";
    inline constexpr const char *Redefinition = "E2003";
    inline constexpr const char *MoveInLoop = "E2004";
    inline constexpr const char *HeapCopyOut = "E2005";
    inline constexpr const char *MutableHeapVar = "E2006";
    inline constexpr const char *HeapInLoopCondition = "E2007";

    inline constexpr const char *UnreachableCode = "W1400";
} // namespace tagc::diag
