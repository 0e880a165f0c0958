#include "core/Input.h"

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_gamepad.h>
#include <SDL3/SDL_joystick.h>
#include <SDL3/SDL_keyboard.h>
#include <SDL3/SDL_scancode.h>
#include <SDL3/SDL_stdinc.h>

#include <memory>

namespace {

// SDL key mappings live here and are consumed by both input processing and UI legends.
constexpr SDL_Scancode kMoveLeftPrimary = SDL_SCANCODE_LEFT;
constexpr SDL_Scancode kMoveLeftAlt = SDL_SCANCODE_A;
constexpr SDL_Scancode kMoveRightPrimary = SDL_SCANCODE_RIGHT;
constexpr SDL_Scancode kMoveRightAlt = SDL_SCANCODE_D;

constexpr SDL_Scancode kUpKey = SDL_SCANCODE_UP;
constexpr SDL_Scancode kDownPrimary = SDL_SCANCODE_DOWN;
constexpr SDL_Scancode kDownAlt = SDL_SCANCODE_S;

constexpr SDL_Scancode kJumpPrimary = SDL_SCANCODE_SPACE;
constexpr SDL_Scancode kJumpAlt = SDL_SCANCODE_W;
constexpr SDL_Scancode kDashKey = SDL_SCANCODE_Q;
constexpr SDL_Scancode kAttackKey = SDL_SCANCODE_F;
constexpr SDL_Scancode kRollKey = SDL_SCANCODE_LSHIFT;

constexpr SDL_Scancode kToggleOverlayKey = SDL_SCANCODE_F2;
constexpr SDL_Scancode kToggleCollisionKey = SDL_SCANCODE_F3;
constexpr SDL_Scancode kQuitKey = SDL_SCANCODE_ESCAPE;

constexpr SDL_GamepadAxis kMoveAxisX = SDL_GAMEPAD_AXIS_LEFTX;
constexpr SDL_GamepadAxis kMoveAxisY = SDL_GAMEPAD_AXIS_LEFTY;
constexpr SDL_GamepadButton kDpadLeftButton = SDL_GAMEPAD_BUTTON_DPAD_LEFT;
constexpr SDL_GamepadButton kDpadRightButton = SDL_GAMEPAD_BUTTON_DPAD_RIGHT;
constexpr SDL_GamepadButton kDpadUpButton = SDL_GAMEPAD_BUTTON_DPAD_UP;
constexpr SDL_GamepadButton kDpadDownButton = SDL_GAMEPAD_BUTTON_DPAD_DOWN;
constexpr SDL_GamepadButton kJumpButton = SDL_GAMEPAD_BUTTON_SOUTH;
constexpr SDL_GamepadButton kAttackButton = SDL_GAMEPAD_BUTTON_WEST;
constexpr SDL_GamepadButton kDashButton = SDL_GAMEPAD_BUTTON_EAST;
constexpr SDL_GamepadButton kRollButton = SDL_GAMEPAD_BUTTON_RIGHT_SHOULDER;

const char* prettyScancode(SDL_Scancode sc) {
  switch (sc) {
    case SDL_SCANCODE_LEFT:
      return "←";
    case SDL_SCANCODE_RIGHT:
      return "→";
    case SDL_SCANCODE_UP:
      return "↑";
    case SDL_SCANCODE_DOWN:
      return "↓";
    default:
      break;
  }

  const char* name = SDL_GetScancodeName(sc);
  if (!name || !*name)
    return "?";
  return name;
}

// Sets held and raises pressed/released on the edge.
void track(bool now, bool& held, bool& pressed, bool* released = nullptr) {
  if (now && !held)
    pressed = true;
  if (!now && held && released)
    *released = true;
  held = now;
}

}  // namespace

void Input::clearGamepadState() {
  axisLeftX_ = 0;
  axisLeftY_ = 0;
  dpadLeft_ = false;
  dpadRight_ = false;
  dpadUp_ = false;
  dpadDown_ = false;
  btnSouth_ = false;
  btnWest_ = false;
  btnEast_ = false;
  btnShoulder_ = false;
}

void Input::tryOpenFirstGamepad() {
  if (gamepad_)
    return;

  int count = 0;
  using GamepadListPtr = std::unique_ptr<SDL_JoystickID, decltype(&SDL_free)>;
  GamepadListPtr ids(SDL_GetGamepads(&count), SDL_free);
  if (!ids || count <= 0) {
    return;
  }

  for (int i = 0; i < count; ++i) {
    SDL_Gamepad* gp = SDL_OpenGamepad(ids.get()[i]);
    if (!gp)
      continue;
    gamepad_ = gp;
    gamepadId_ = ids.get()[i];
    break;
  }
}

void Input::init() {
  SDL_SetGamepadEventsEnabled(true);
  tryOpenFirstGamepad();
}

void Input::shutdown() {
  if (gamepad_) {
    SDL_CloseGamepad(gamepad_);
    gamepad_ = nullptr;
  }
  gamepadId_ = 0;
  clearGamepadState();
}

// NOLINTNEXTLINE
void Input::handleEvent(const SDL_Event& e) {
  if (e.type == SDL_EVENT_GAMEPAD_ADDED) {
    if (!gamepad_) {
      SDL_Gamepad* gp = SDL_OpenGamepad(e.gdevice.which);
      if (gp) {
        gamepad_ = gp;
        gamepadId_ = e.gdevice.which;
      }
    }
    return;
  }
  if (e.type == SDL_EVENT_GAMEPAD_REMOVED) {
    if (gamepad_ && e.gdevice.which == gamepadId_) {
      SDL_CloseGamepad(gamepad_);
      gamepad_ = nullptr;
      gamepadId_ = 0;
      clearGamepadState();
      tryOpenFirstGamepad();
      updateDerivedActions();
    }
    return;
  }
  if (e.type == SDL_EVENT_GAMEPAD_AXIS_MOTION) {
    if (gamepad_ && e.gaxis.which == gamepadId_) {
      if (e.gaxis.axis == kMoveAxisX)
        axisLeftX_ = static_cast<int>(e.gaxis.value);
      else if (e.gaxis.axis == kMoveAxisY)
        axisLeftY_ = static_cast<int>(e.gaxis.value);
      updateDerivedActions();
    }
    return;
  }
  if (e.type == SDL_EVENT_GAMEPAD_BUTTON_DOWN || e.type == SDL_EVENT_GAMEPAD_BUTTON_UP) {
    if (gamepad_ && e.gbutton.which == gamepadId_) {
      const bool down = e.gbutton.down;
      switch (e.gbutton.button) {
        case kDpadLeftButton:
          dpadLeft_ = down;
          break;
        case kDpadRightButton:
          dpadRight_ = down;
          break;
        case kDpadUpButton:
          dpadUp_ = down;
          break;
        case kDpadDownButton:
          dpadDown_ = down;
          break;
        case kJumpButton:
          btnSouth_ = down;
          break;
        case kAttackButton:
          btnWest_ = down;
          break;
        case kDashButton:
          btnEast_ = down;
          break;
        case kRollButton:
          btnShoulder_ = down;
          break;
        default:
          break;
      }
      updateDerivedActions();
    }
    return;
  }

  if (e.type != SDL_EVENT_KEY_DOWN && e.type != SDL_EVENT_KEY_UP)
    return;

  const int sc = static_cast<int>(e.key.scancode);
  if (sc < 0 || sc >= static_cast<int>(scancodeDown_.size()))
    return;

  scancodeDown_[sc] = e.key.down;
  updateDerivedActions();
}

const char* Input::gamepadName() const {
  if (!gamepad_)
    return nullptr;
  const char* name = SDL_GetGamepadName(gamepad_);
  if (!name || !*name)
    return nullptr;
  return name;
}

void Input::appendLegend(std::vector<std::string>& out) const {
  out.push_back(std::string("Move: ") + prettyScancode(kMoveLeftPrimary) + "/" +
                prettyScancode(kMoveRightPrimary) + " or " + prettyScancode(kMoveLeftAlt) + "/" +
                prettyScancode(kMoveRightAlt) + "  (pad: D-pad / left stick)");
  out.push_back(std::string("Jump: ") + prettyScancode(kJumpPrimary) + " or " +
                prettyScancode(kJumpAlt) + "  (pad: South)");
  out.push_back(std::string("Attack: ") + prettyScancode(kAttackKey) + "  (pad: West)");
  out.push_back(std::string("Dash: ") + prettyScancode(kDashKey) + "  (pad: East)");
  out.push_back(std::string("Roll: ") + prettyScancode(kRollKey) + "  (pad: right shoulder)");
  out.push_back(std::string("Let go of a ledge: ") + prettyScancode(kDownPrimary) + " or " +
                prettyScancode(kDownAlt));
  if (const char* gpName = gamepadName())
    out.push_back(std::string("Gamepad: ") + gpName);
  out.push_back(std::string("Toggles: ") + prettyScancode(kToggleOverlayKey) + " overlay  " +
                prettyScancode(kToggleCollisionKey) + " collision  Quit: " +
                prettyScancode(kQuitKey));
}

InputState Input::consume() {
  InputState out = state_;
  clearEdges();
  return out;
}

AppCommands Input::consumeCommands() {
  AppCommands out = commands_;
  commands_ = AppCommands{};
  return out;
}

void Input::clearEdges() {
  state_.downPressed = false;
  state_.jumpPressed = false;
  state_.jumpReleased = false;
  state_.attackPressed = false;
  state_.dashPressed = false;
  state_.rollPressed = false;
}

void Input::updateDerivedActions() {
  const bool leftKey = scancodeDown_[kMoveLeftPrimary] || scancodeDown_[kMoveLeftAlt];
  const bool rightKey = scancodeDown_[kMoveRightPrimary] || scancodeDown_[kMoveRightAlt];

  const bool leftPad = dpadLeft_ || (axisLeftX_ < -axisDeadzone_);
  const bool rightPad = dpadRight_ || (axisLeftX_ > axisDeadzone_);

  state_.left = leftKey || leftPad;
  state_.right = rightKey || rightPad;
  state_.upHeld = scancodeDown_[kUpKey] || dpadUp_ || (axisLeftY_ < -axisDeadzone_);

  const bool downNow = scancodeDown_[kDownPrimary] || scancodeDown_[kDownAlt] || dpadDown_ ||
                       (axisLeftY_ > axisDeadzone_);
  track(downNow, state_.downHeld, state_.downPressed);

  const bool jumpNow = scancodeDown_[kJumpPrimary] || scancodeDown_[kJumpAlt] || btnSouth_;
  track(jumpNow, state_.jumpHeld, state_.jumpPressed, &state_.jumpReleased);

  track(scancodeDown_[kAttackKey] || btnWest_, state_.attackHeld, state_.attackPressed);
  track(scancodeDown_[kDashKey] || btnEast_, state_.dashHeld, state_.dashPressed);
  track(scancodeDown_[kRollKey] || btnShoulder_, state_.rollHeld, state_.rollPressed);

  track(scancodeDown_[kToggleOverlayKey], f2Held_, commands_.toggleDebugOverlay);
  track(scancodeDown_[kToggleCollisionKey], f3Held_, commands_.toggleDebugCollision);
  track(scancodeDown_[kQuitKey], escHeld_, commands_.quit);
}
