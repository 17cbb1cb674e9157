#pragma once

bool CreateOverlay();

void SetOverlayAlpha(double alpha);
void ResetOverlayPosition();
void OpenOverlayConfig();
void ReloadOverlayConfig();
void CloseOverlay();
