// SPDX-License-Identifier: Apache-2.0
#include "BuiltinTemplates.hpp"

namespace apkforge
{

namespace
{
    // Gradle 8.5 pairs with Android Gradle Plugin 8.2.x.
    constexpr auto SettingsGradle = R"(pluginManagement {
    repositories {
        google()
        mavenCentral()
        gradlePluginPortal()
    }
}
dependencyResolutionManagement {
    repositoriesMode.set(RepositoriesMode.FAIL_ON_PROJECT_REPOS)
    repositories {
        google()
        mavenCentral()
    }
}

rootProject.name = '{{PROJECT_NAME}}'
include ':app'
)";

    constexpr auto RootBuildGradleKotlin = R"(// Top-level build file
plugins {
    id 'com.android.application' version '8.2.2' apply false
    id 'org.jetbrains.kotlin.android' version '1.9.24' apply false
}
)";

    constexpr auto RootBuildGradleJava = R"(// Top-level build file
plugins {
    id 'com.android.application' version '8.2.2' apply false
}
)";

    constexpr auto GradleProperties = R"(# Project-wide Gradle settings
org.gradle.jvmargs=-Xmx2048m -Dfile.encoding=UTF-8
android.useAndroidX=true
android.nonTransitiveRClass=true
kotlin.code.style=official
)";

    constexpr auto AppBuildGradleKotlin = R"(plugins {
    id 'com.android.application'
    id 'org.jetbrains.kotlin.android'
}

android {
    namespace '{{PACKAGE_NAME}}'
    compileSdk {{COMPILE_SDK}}

    defaultConfig {
        applicationId '{{PACKAGE_NAME}}'
        minSdk {{MIN_SDK}}
        targetSdk {{TARGET_SDK}}
        versionCode 1
        versionName "1.0"
    }

    buildTypes {
        release {
            minifyEnabled false
            proguardFiles getDefaultProguardFile('proguard-android-optimize.txt'), 'proguard-rules.pro'
        }
    }

    compileOptions {
        sourceCompatibility JavaVersion.VERSION_17
        targetCompatibility JavaVersion.VERSION_17
    }

    kotlinOptions {
        jvmTarget = '17'
    }
}

dependencies {
    implementation 'androidx.core:core-ktx:1.12.0'
    implementation 'androidx.appcompat:appcompat:1.6.1'
    implementation 'com.google.android.material:material:1.11.0'
    implementation 'androidx.constraintlayout:constraintlayout:2.1.4'
}
)";

    constexpr auto AppBuildGradleJava = R"(plugins {
    id 'com.android.application'
}

android {
    namespace '{{PACKAGE_NAME}}'
    compileSdk {{COMPILE_SDK}}

    defaultConfig {
        applicationId '{{PACKAGE_NAME}}'
        minSdk {{MIN_SDK}}
        targetSdk {{TARGET_SDK}}
        versionCode 1
        versionName "1.0"
    }

    buildTypes {
        release {
            minifyEnabled false
            proguardFiles getDefaultProguardFile('proguard-android-optimize.txt'), 'proguard-rules.pro'
        }
    }

    compileOptions {
        sourceCompatibility JavaVersion.VERSION_17
        targetCompatibility JavaVersion.VERSION_17
    }
}

dependencies {
    implementation 'androidx.appcompat:appcompat:1.6.1'
    implementation 'com.google.android.material:material:1.11.0'
    implementation 'androidx.constraintlayout:constraintlayout:2.1.4'
}
)";

    constexpr auto ProguardRules = R"(# Add project specific ProGuard rules here.
)";

    constexpr auto AndroidManifest = R"(<?xml version="1.0" encoding="utf-8"?>
<manifest xmlns:android="http://schemas.android.com/apk/res/android"
    xmlns:tools="http://schemas.android.com/tools">

    <uses-permission android:name="android.permission.INTERNET" />

    <application
        android:allowBackup="true"
        android:dataExtractionRules="@xml/data_extraction_rules"
        android:fullBackupContent="@xml/backup_rules"
        android:label="@string/app_name"
        android:supportsRtl="true"
        android:theme="@style/Theme.{{PROJECT_NAME}}"
        tools:targetApi="31">

        <activity
            android:name=".MainActivity"
            android:exported="true">
            <intent-filter>
                <action android:name="android.intent.action.MAIN" />
                <category android:name="android.intent.category.LAUNCHER" />
            </intent-filter>
        </activity>
    </application>

</manifest>
)";

    constexpr auto MainActivityKotlin = R"(package {{PACKAGE_NAME}}

import android.os.Bundle
import android.widget.TextView
import androidx.appcompat.app.AppCompatActivity

class MainActivity : AppCompatActivity() {
    override fun onCreate(savedInstanceState: Bundle?) {
        super.onCreate(savedInstanceState)
        setContentView(R.layout.activity_main)
        findViewById<TextView>(R.id.titleText).text = getString(R.string.welcome_message)
    }
}
)";

    constexpr auto MainActivityJava = R"(package {{PACKAGE_NAME}};

import android.os.Bundle;
import android.widget.TextView;
import androidx.appcompat.app.AppCompatActivity;

public class MainActivity extends AppCompatActivity {
    @Override
    protected void onCreate(Bundle savedInstanceState) {
        super.onCreate(savedInstanceState);
        setContentView(R.layout.activity_main);
        TextView title = findViewById(R.id.titleText);
        title.setText(getString(R.string.welcome_message));
    }
}
)";

    constexpr auto ActivityMainLayout = R"(<?xml version="1.0" encoding="utf-8"?>
<androidx.constraintlayout.widget.ConstraintLayout xmlns:android="http://schemas.android.com/apk/res/android"
    xmlns:app="http://schemas.android.com/apk/res-auto"
    xmlns:tools="http://schemas.android.com/tools"
    android:layout_width="match_parent"
    android:layout_height="match_parent"
    tools:context=".MainActivity">

    <TextView
        android:id="@+id/titleText"
        android:layout_width="wrap_content"
        android:layout_height="wrap_content"
        android:text="@string/welcome_message"
        android:textSize="24sp"
        android:textStyle="bold"
        app:layout_constraintBottom_toBottomOf="parent"
        app:layout_constraintEnd_toEndOf="parent"
        app:layout_constraintStart_toStartOf="parent"
        app:layout_constraintTop_toTopOf="parent" />

</androidx.constraintlayout.widget.ConstraintLayout>
)";

    constexpr auto StringsXml = R"(<?xml version="1.0" encoding="utf-8"?>
<resources>
    <string name="app_name">{{APP_LABEL}}</string>
    <string name="welcome_message">Welcome to {{APP_LABEL}}!</string>
</resources>
)";

    constexpr auto ColorsXml = R"(<?xml version="1.0" encoding="utf-8"?>
<resources>
    <color name="purple_200">#FFBB86FC</color>
    <color name="purple_500">#FF6200EE</color>
    <color name="purple_700">#FF3700B3</color>
    <color name="teal_200">#FF03DAC5</color>
    <color name="teal_700">#FF018786</color>
    <color name="black">#FF000000</color>
    <color name="white">#FFFFFFFF</color>
</resources>
)";

    constexpr auto ThemesXml = R"(<?xml version="1.0" encoding="utf-8"?>
<resources xmlns:tools="http://schemas.android.com/tools">
    <style name="Theme.{{PROJECT_NAME}}" parent="Theme.MaterialComponents.DayNight.DarkActionBar">
        <item name="colorPrimary">@color/purple_500</item>
        <item name="colorPrimaryVariant">@color/purple_700</item>
        <item name="colorOnPrimary">@color/white</item>
        <item name="colorSecondary">@color/teal_200</item>
        <item name="colorSecondaryVariant">@color/teal_700</item>
        <item name="colorOnSecondary">@color/black</item>
        <item name="android:statusBarColor" tools:targetApi="l">?attr/colorPrimaryVariant</item>
    </style>
</resources>
)";

    constexpr auto BackupRulesXml = R"(<?xml version="1.0" encoding="utf-8"?>
<full-backup-content>
</full-backup-content>
)";

    constexpr auto DataExtractionRulesXml = R"(<?xml version="1.0" encoding="utf-8"?>
<data-extraction-rules>
    <cloud-backup>
    </cloud-backup>
</data-extraction-rules>
)";

    constexpr auto Readme = R"(# {{APP_LABEL}}

{{DESCRIPTION}}

## Build

    gradle assembleDebug

The debug APK is written to `app/build/outputs/apk/debug/`.

- Package: `{{PACKAGE_NAME}}`
- Language: {{LANGUAGE}}
- minSdk {{MIN_SDK}}, targetSdk {{TARGET_SDK}}, compileSdk {{COMPILE_SDK}}
)";

    auto emptyActivityTemplate() -> ProjectTemplate
    {
        auto const kotlin = std::optional { SourceLanguage::Kotlin };
        auto const java = std::optional { SourceLanguage::Java };
        auto const any = std::optional<SourceLanguage> {};

        return ProjectTemplate {
            .id = std::string(EmptyActivityTemplateId),
            .description = "Single activity app with a centered title",
            .sourceRoot = "app/src/main/java/{{PACKAGE_PATH}}",
            .files = {
                TemplateFile { "settings.gradle", SettingsGradle, false, any },
                TemplateFile { "build.gradle", RootBuildGradleKotlin, false, kotlin },
                TemplateFile { "build.gradle", RootBuildGradleJava, false, java },
                TemplateFile { "gradle.properties", GradleProperties, false, any },
                TemplateFile { "app/build.gradle", AppBuildGradleKotlin, false, kotlin },
                TemplateFile { "app/build.gradle", AppBuildGradleJava, false, java },
                TemplateFile { "app/proguard-rules.pro", ProguardRules, false, any },
                TemplateFile { "app/src/main/AndroidManifest.xml", AndroidManifest, false, any },
                TemplateFile { "app/src/main/java/{{PACKAGE_PATH}}/MainActivity.kt", MainActivityKotlin, false, kotlin },
                TemplateFile { "app/src/main/java/{{PACKAGE_PATH}}/MainActivity.java", MainActivityJava, false, java },
                TemplateFile { "app/src/main/res/layout/activity_main.xml", ActivityMainLayout, false, any },
                TemplateFile { "app/src/main/res/values/strings.xml", StringsXml, false, any },
                TemplateFile { "app/src/main/res/values/colors.xml", ColorsXml, false, any },
                TemplateFile { "app/src/main/res/values/themes.xml", ThemesXml, false, any },
                TemplateFile { "app/src/main/res/xml/backup_rules.xml", BackupRulesXml, false, any },
                TemplateFile { "app/src/main/res/xml/data_extraction_rules.xml", DataExtractionRulesXml, false, any },
                TemplateFile { "README.md", Readme, false, any },
            },
        };
    }
} // namespace

auto builtinTemplates() -> std::vector<ProjectTemplate>
{
    return { emptyActivityTemplate() };
}

} // namespace apkforge
